#pragma once
#include <map>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "workflow/workflow_data.hpp"

namespace warden::workflow {

// Runtime paths shared by the agent job and the engines
inline constexpr const char* kPromptPath = "/tmp/gh-aw/aw-prompts/prompt.txt";
inline constexpr const char* kMcpConfigPath = "/tmp/gh-aw/mcp-config/mcp-servers.json";
inline constexpr const char* kSafeOutputsPath = "/tmp/gh-aw/safeoutputs/outputs.jsonl";
inline constexpr const char* kAgentLogPath = "/tmp/gh-aw/agent-stdio.log";

// Tool servers the agent job exposes to the engine
struct McpServerSet {
    bool github = false;
    std::vector<std::string> github_toolsets;
    bool github_read_only = true;
    bool safe_outputs = false;
};

// An execution engine as seen by the compiler: it contributes steps and a
// tool-server configuration, nothing else.
class CodingAgentEngine {
public:
    virtual ~CodingAgentEngine() = default;

    virtual std::string id() const = 0;
    virtual std::string display_name() const = 0;

    virtual std::vector<nlohmann::json> installation_steps(const WorkflowData& data) const = 0;
    virtual std::vector<nlohmann::json> execution_steps(const WorkflowData& data,
                                                        const std::string& log_file) const = 0;

    // {"mcpServers": {...}} in the common stdio layout
    virtual nlohmann::json render_mcp_config(const McpServerSet& servers) const;
};

// Engine id -> shared immutable engine
class EngineRegistry {
public:
    EngineRegistry() = default;

    // False when the id is already taken
    bool register_engine(std::shared_ptr<const CodingAgentEngine> engine);

    std::shared_ptr<const CodingAgentEngine> get(const std::string& id) const;
    std::vector<std::string> ids() const;

    // copilot, claude, codex and custom
    static std::shared_ptr<const EngineRegistry> with_builtin_engines();

private:
    std::map<std::string, std::shared_ptr<const CodingAgentEngine>> engines_;
};

// Table row for an npm-distributed agent CLI
struct CliEngineSpec {
    std::string id;
    std::string display_name;
    std::string package;         // npm package
    std::string default_version;
    std::string binary;
    std::string secret;          // API key secret the CLI reads
    std::vector<std::string> base_args;
    std::string max_turns_flag;  // empty: not supported
};

class CliEngine : public CodingAgentEngine {
public:
    explicit CliEngine(CliEngineSpec spec) : spec_(std::move(spec)) {}

    std::string id() const override { return spec_.id; }
    std::string display_name() const override { return spec_.display_name; }

    std::vector<nlohmann::json> installation_steps(const WorkflowData& data) const override;
    std::vector<nlohmann::json> execution_steps(const WorkflowData& data,
                                                const std::string& log_file) const override;

    const CliEngineSpec& spec() const { return spec_; }

private:
    CliEngineSpec spec_;
};

// Runs the steps listed under engine.steps
class CustomEngine : public CodingAgentEngine {
public:
    std::string id() const override { return "custom"; }
    std::string display_name() const override { return "Custom Steps"; }

    std::vector<nlohmann::json> installation_steps(const WorkflowData& data) const override;
    std::vector<nlohmann::json> execution_steps(const WorkflowData& data,
                                                const std::string& log_file) const override;
};

} // namespace warden::workflow
