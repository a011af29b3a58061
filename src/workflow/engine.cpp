#include "workflow/engine.hpp"
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace warden::workflow {

namespace {

std::string join(const std::vector<std::string>& items, const char* sep) {
    std::string result;
    for (const auto& item : items) {
        if (!result.empty()) result += sep;
        result += item;
    }
    return result;
}

const std::vector<CliEngineSpec>& builtin_cli_engines() {
    static const std::vector<CliEngineSpec> specs = {
        {"copilot", "GitHub Copilot CLI", "@github/copilot", "0.0.354", "copilot",
         "COPILOT_GITHUB_TOKEN", {"--allow-all-tools", "--no-color"}, ""},
        {"claude", "Claude Code", "@anthropic-ai/claude-code", "2.0.42", "claude",
         "ANTHROPIC_API_KEY", {"--print", "--output-format", "stream-json", "--verbose"}, "--max-turns"},
        {"codex", "Codex", "@openai/codex", "0.58.0", "codex",
         "OPENAI_API_KEY", {"exec", "--full-auto", "--skip-git-repo-check"}, ""},
    };
    return specs;
}

} // anonymous namespace

json CodingAgentEngine::render_mcp_config(const McpServerSet& servers) const {
    json mcp = json::object();

    if (servers.github) {
        mcp["github"] = {
            {"type", "stdio"},
            {"command", "docker"},
            {"args", json::array({"run", "-i", "--rm", "-e", "GITHUB_PERSONAL_ACCESS_TOKEN",
                                  "-e", "GITHUB_TOOLSETS", "-e", "GITHUB_READ_ONLY",
                                  "ghcr.io/github/github-mcp-server:v0.20.2"})},
            {"env", {
                {"GITHUB_PERSONAL_ACCESS_TOKEN", "${GITHUB_MCP_SERVER_TOKEN}"},
                {"GITHUB_TOOLSETS", join(servers.github_toolsets, ",")},
                {"GITHUB_READ_ONLY", servers.github_read_only ? "1" : "0"},
            }},
        };
    }

    if (servers.safe_outputs) {
        mcp["safeoutputs"] = {
            {"type", "stdio"},
            {"command", "node"},
            {"args", json::array({"/tmp/gh-aw/safeoutputs/mcp-server.cjs"})},
            {"env", {{"GH_AW_SAFE_OUTPUTS", kSafeOutputsPath}}},
        };
    }

    return {{"mcpServers", mcp}};
}

bool EngineRegistry::register_engine(std::shared_ptr<const CodingAgentEngine> engine) {
    if (!engine) return false;
    std::string id = engine->id();
    if (engines_.count(id)) {
        spdlog::warn("Engine '{}' already registered", id);
        return false;
    }
    engines_[id] = std::move(engine);
    return true;
}

std::shared_ptr<const CodingAgentEngine> EngineRegistry::get(const std::string& id) const {
    auto it = engines_.find(id);
    if (it == engines_.end()) {
        return nullptr;
    }
    return it->second;
}

std::vector<std::string> EngineRegistry::ids() const {
    std::vector<std::string> result;
    for (const auto& [id, engine] : engines_) {
        result.push_back(id);
    }
    return result;
}

std::shared_ptr<const EngineRegistry> EngineRegistry::with_builtin_engines() {
    auto registry = std::make_shared<EngineRegistry>();
    for (const auto& spec : builtin_cli_engines()) {
        registry->register_engine(std::make_shared<CliEngine>(spec));
    }
    registry->register_engine(std::make_shared<CustomEngine>());
    return registry;
}

std::vector<json> CliEngine::installation_steps(const WorkflowData& data) const {
    // A user-supplied command is assumed to be installed already
    if (!data.engine.command.empty()) {
        return {};
    }

    std::string version = data.engine.version.empty() ? spec_.default_version : data.engine.version;
    return std::vector<json>{
        {
            {"name", "Validate " + spec_.secret + " secret"},
            {"run", "if [ -z \"$SECRET_VALUE\" ]; then\n"
                    "  echo \"" + spec_.secret + " is not set\" >&2\n"
                    "  exit 1\n"
                    "fi"},
            {"env", {{"SECRET_VALUE", "${{ secrets." + spec_.secret + " }}"}}},
        },
        {
            {"name", "Setup Node.js"},
            {"uses", "actions/setup-node@v6"},
            {"with", {{"node-version", "24"}, {"package-manager-cache", false}}},
        },
        {
            {"name", "Install " + spec_.display_name},
            {"run", "npm install -g --silent " + spec_.package + "@" + version},
        },
    };
}

std::vector<json> CliEngine::execution_steps(const WorkflowData& data, const std::string& log_file) const {
    std::vector<std::string> args = {data.engine.command.empty() ? spec_.binary : data.engine.command};
    args.insert(args.end(), spec_.base_args.begin(), spec_.base_args.end());
    if (!data.engine.model.empty()) {
        args.push_back("--model");
        args.push_back(data.engine.model);
    }
    if (data.engine.max_turns > 0) {
        if (spec_.max_turns_flag.empty()) {
            spdlog::warn("Engine '{}' does not support max-turns, ignoring", spec_.id);
        } else {
            args.push_back(spec_.max_turns_flag);
            args.push_back(std::to_string(data.engine.max_turns));
        }
    }
    args.insert(args.end(), data.engine.args.begin(), data.engine.args.end());

    json env = {
        {spec_.secret, "${{ secrets." + spec_.secret + " }}"},
        {"GH_AW_PROMPT", kPromptPath},
        {"GH_AW_MCP_CONFIG", kMcpConfigPath},
        {"GH_AW_SAFE_OUTPUTS", kSafeOutputsPath},
    };
    for (const auto& [key, value] : data.engine.env) {
        env[key] = value;
    }

    json step = {
        {"name", "Execute " + spec_.display_name},
        {"id", "agentic_execution"},
        {"timeout-minutes", data.timeout_minutes},
        {"run", "set -o pipefail\n" + join(args, " ") +
                " --prompt \"$(cat \"$GH_AW_PROMPT\")\" 2>&1 | tee " + log_file},
        {"env", env},
    };
    return std::vector<json>{step};
}

std::vector<json> CustomEngine::installation_steps(const WorkflowData& /*data*/) const {
    return {};
}

std::vector<json> CustomEngine::execution_steps(const WorkflowData& data, const std::string& log_file) const {
    std::vector<json> steps;
    for (const auto& step : data.engine.steps) {
        json copy = step;
        if (copy.is_object()) {
            if (!copy.contains("env")) copy["env"] = json::object();
            copy["env"]["GH_AW_PROMPT"] = kPromptPath;
            copy["env"]["GH_AW_MCP_CONFIG"] = kMcpConfigPath;
            copy["env"]["GH_AW_SAFE_OUTPUTS"] = kSafeOutputsPath;
            copy["env"]["GH_AW_AGENT_LOG"] = log_file;
        }
        steps.push_back(copy);
    }
    if (steps.empty()) {
        spdlog::warn("Custom engine declared without steps");
    }
    return steps;
}

} // namespace warden::workflow
