#include "workflow/steps.hpp"

using json = nlohmann::json;

namespace warden::workflow {

std::vector<json> setup_steps(const CompilerConfig& config) {
    std::vector<json> steps;
    if (config.action_mode == ActionMode::DEV) {
        steps.push_back({
            {"name", "Checkout actions folder"},
            {"uses", kCheckoutAction},
            {"with", {{"sparse-checkout", "actions"}, {"persist-credentials", false}}},
        });
        steps.push_back({
            {"name", "Setup Scripts"},
            {"uses", "./actions/setup"},
            {"with", {{"destination", kSetupScriptsDir}}},
        });
        return steps;
    }

    steps.push_back({
        {"name", "Setup Scripts"},
        {"uses", config.action_repo + "/actions/setup@" + config.version},
        {"with", {{"destination", kSetupScriptsDir}}},
    });
    return steps;
}

json checkout_step() {
    return {
        {"name", "Checkout repository"},
        {"uses", kCheckoutAction},
        {"with", {{"persist-credentials", false}}},
    };
}

json github_script_step(const std::string& name, const std::string& id,
                        const std::string& script_name, const std::string& token,
                        const std::map<std::string, std::string>& env) {
    std::string script =
        "const { setupGlobals } = require('" + std::string(kSetupScriptsDir) + "/setup_globals.cjs');\n"
        "setupGlobals(core, github, context, exec, io);\n"
        "const { main } = require('" + std::string(kSetupScriptsDir) + "/" + script_name + ".cjs');\n"
        "await main();";

    json step = {
        {"name", name},
        {"id", id},
        {"uses", kGithubScriptAction},
    };
    if (!env.empty()) {
        step["env"] = env;
    }
    json with = {{"script", script}};
    if (!token.empty()) {
        with["github-token"] = token;
    }
    step["with"] = with;
    return step;
}

json download_agent_output_step() {
    return {
        {"name", "Download agent output artifact"},
        {"continue-on-error", true},
        {"uses", kDownloadArtifactAction},
        {"with", {{"name", kAgentOutputArtifact}, {"path", kAgentOutputDir}}},
    };
}

json upload_artifact_step(const std::string& name, const std::string& artifact, const std::string& path) {
    return {
        {"name", name},
        {"if", "always()"},
        {"uses", kUploadArtifactAction},
        {"with", {{"name", artifact}, {"path", path}, {"if-no-files-found", "ignore"}}},
    };
}

} // namespace warden::workflow
