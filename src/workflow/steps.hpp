#pragma once
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "workflow/compiler_config.hpp"

namespace warden::workflow {

// Pinned third-party actions referenced by generated steps
inline constexpr const char* kCheckoutAction = "actions/checkout@v5";
inline constexpr const char* kGithubScriptAction = "actions/github-script@v8";
inline constexpr const char* kDownloadArtifactAction = "actions/download-artifact@v5";
inline constexpr const char* kUploadArtifactAction = "actions/upload-artifact@v4";

inline constexpr const char* kSetupScriptsDir = "/tmp/gh-aw/actions";
inline constexpr const char* kAgentOutputArtifact = "agent_output.json";
inline constexpr const char* kAgentOutputDir = "/tmp/gh-aw/safeoutputs/";

// Steps that make the helper scripts available to a job. Dev mode checks out
// the local actions directory first; release mode uses the published action.
std::vector<nlohmann::json> setup_steps(const CompilerConfig& config);

// Shallow checkout of the repository being automated
nlohmann::json checkout_step();

// actions/github-script step that runs one helper script
nlohmann::json github_script_step(const std::string& name, const std::string& id,
                                  const std::string& script_name, const std::string& token,
                                  const std::map<std::string, std::string>& env = {});

nlohmann::json download_agent_output_step();
nlohmann::json upload_artifact_step(const std::string& name, const std::string& artifact,
                                    const std::string& path);

} // namespace warden::workflow
