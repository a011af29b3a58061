#include "workflow/workflow_data.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>
#include "core/paths.hpp"

using json = nlohmann::json;

namespace warden::workflow {

namespace {

std::string string_or(const json& obj, const char* key, const std::string& fallback = "") {
    auto it = obj.find(key);
    if (it != obj.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return fallback;
}

std::vector<std::string> string_list(const json& value) {
    std::vector<std::string> result;
    if (value.is_string()) {
        result.push_back(value.get<std::string>());
    } else if (value.is_array()) {
        for (const auto& item : value) {
            if (item.is_string()) result.push_back(item.get<std::string>());
        }
    }
    return result;
}

// Group name from "concurrency: <group>" or "concurrency: {group: ...}"
std::string concurrency_group(const json& value) {
    if (value.is_string()) return value.get<std::string>();
    if (value.is_object()) return string_or(value, "group");
    return "";
}

// Scalar rendered as text; reactions such as +1 may arrive as numbers
std::string scalar_text(const json& value) {
    if (value.is_string()) return value.get<std::string>();
    if (value.is_null()) return "";
    return value.dump();
}

bool parse_triggers(const json& on, WorkflowData& data, std::string& error) {
    if (on.is_string()) {
        data.triggers.push_back(on.get<std::string>());
        return true;
    }
    if (on.is_array()) {
        data.triggers = string_list(on);
        return true;
    }
    if (!on.is_object()) {
        error = "'on' must be a string, list or map";
        return false;
    }

    for (auto it = on.begin(); it != on.end(); ++it) {
        const std::string& key = it.key();
        // Gating settings that live beside the events
        if (key == "stop-after") {
            data.stop_time = scalar_text(it.value());
            continue;
        }
        if (key == "reaction") {
            data.reaction = scalar_text(it.value());
            continue;
        }
        if (key == "roles") {
            data.roles = string_list(it.value());
            continue;
        }

        data.triggers.push_back(key);
        if (key == "command" || key == "slash_command") {
            const json& value = it.value();
            if (value.is_string()) {
                data.command.push_back(value.get<std::string>());
            } else if (value.is_object() && value.contains("name")) {
                data.command = string_list(value["name"]);
            }
            if (data.command.empty()) {
                data.command.push_back(data.workflow_id);
            }
        }
    }
    return true;
}

bool parse_engine(const json& value, EngineConfig& engine, std::string& error) {
    if (value.is_string()) {
        engine.id = value.get<std::string>();
        return true;
    }
    if (!value.is_object()) {
        error = "'engine' must be a string or a map";
        return false;
    }

    engine.id = string_or(value, "id", "copilot");
    engine.version = scalar_text(value.value("version", json()));
    engine.model = string_or(value, "model");
    engine.command = string_or(value, "command");
    if (value.contains("args")) engine.args = string_list(value["args"]);
    if (value.contains("env") && value["env"].is_object()) {
        for (auto it = value["env"].begin(); it != value["env"].end(); ++it) {
            engine.env[it.key()] = scalar_text(it.value());
        }
    }
    if (value.contains("steps")) {
        if (!value["steps"].is_array()) {
            error = "engine.steps must be an array";
            return false;
        }
        for (const auto& step : value["steps"]) {
            engine.steps.push_back(step);
        }
    }
    if (value.contains("concurrency")) {
        engine.concurrency = concurrency_group(value["concurrency"]);
    }
    if (value.contains("max-turns") && value["max-turns"].is_number_integer()) {
        engine.max_turns = value["max-turns"].get<int>();
    }
    return true;
}

std::optional<GitHubToolConfig> parse_github_tool(const json& tools) {
    if (!tools.is_object() || !tools.contains("github")) {
        return std::nullopt;
    }
    const json& github = tools["github"];
    if (github.is_boolean() && !github.get<bool>()) {
        return std::nullopt;
    }

    GitHubToolConfig cfg;
    if (github.is_object()) {
        if (github.contains("toolsets")) cfg.toolsets = string_list(github["toolsets"]);
        else if (github.contains("toolset")) cfg.toolsets = string_list(github["toolset"]);
        if (github.contains("read-only") && github["read-only"].is_boolean()) {
            cfg.read_only = github["read-only"].get<bool>();
        }
    }
    return cfg;
}

} // anonymous namespace

bool WorkflowData::has_trigger(const std::string& fragment) const {
    return std::any_of(triggers.begin(), triggers.end(), [&](const std::string& trigger) {
        return trigger.find(fragment) != std::string::npos;
    });
}

WorkflowParseResult parse_workflow_data(const json& frontmatter, const std::string& source_path,
                                        const std::string& markdown) {
    WorkflowParseResult result;
    if (!frontmatter.is_object()) {
        result.error = "frontmatter must be a map";
        return result;
    }

    auto& data = result.data;
    try {
        data.source_path = source_path;
        data.workflow_id = source_path.empty() ? "workflow" : core::paths::workflow_id_from_path(source_path);
        data.name = string_or(frontmatter, "name", data.workflow_id);
        data.source = string_or(frontmatter, "source");
        data.tracker_id = string_or(frontmatter, "tracker-id");
        data.markdown = markdown.empty() ? string_or(frontmatter, "markdown") : markdown;

        if (frontmatter.contains("on")) {
            if (!parse_triggers(frontmatter["on"], data, result.error)) return result;
        } else {
            spdlog::warn("{}: no 'on' triggers declared", data.workflow_id);
        }

        data.engine.id = "copilot";
        if (frontmatter.contains("engine") &&
            !parse_engine(frontmatter["engine"], data.engine, result.error)) {
            return result;
        }

        if (frontmatter.contains("permissions")) {
            data.permissions = parse_permissions(frontmatter["permissions"]);
            if (!data.permissions) {
                result.error = "'permissions' must be a string or a map";
                return result;
            }
        }

        if (frontmatter.contains("stop-after")) data.stop_time = scalar_text(frontmatter["stop-after"]);
        if (frontmatter.contains("reaction")) data.reaction = scalar_text(frontmatter["reaction"]);
        if (frontmatter.contains("roles")) data.roles = string_list(frontmatter["roles"]);

        if (frontmatter.contains("jobs")) {
            if (!frontmatter["jobs"].is_object()) {
                result.error = "'jobs' must be a map";
                return result;
            }
            data.jobs = frontmatter["jobs"];
        }

        if (frontmatter.contains("tools")) {
            data.github_tool = parse_github_tool(frontmatter["tools"]);
        }

        if (frontmatter.contains("safe-outputs")) {
            auto parsed = parse_safe_outputs(frontmatter["safe-outputs"]);
            if (!parsed.success) {
                result.error = parsed.error;
                return result;
            }
            data.safe_outputs = parsed.config;
        }

        if (frontmatter.contains("concurrency")) data.concurrency = concurrency_group(frontmatter["concurrency"]);
        data.if_condition = string_or(frontmatter, "if");
        if (frontmatter.contains("timeout-minutes") && frontmatter["timeout-minutes"].is_number_integer()) {
            data.timeout_minutes = frontmatter["timeout-minutes"].get<int>();
        }
    } catch (const std::exception& e) {
        result.error = std::string("invalid frontmatter: ") + e.what();
        return result;
    }

    result.success = true;
    return result;
}

} // namespace warden::workflow
