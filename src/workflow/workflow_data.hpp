#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "workflow/permissions.hpp"
#include "workflow/safe_outputs.hpp"

namespace warden::workflow {

struct EngineConfig {
    std::string id;
    std::string version;
    std::string model;
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    std::vector<nlohmann::json> steps;  // custom engine only
    std::string concurrency;            // explicit job-level group
    int max_turns = 0;
};

struct GitHubToolConfig {
    std::vector<std::string> toolsets;  // empty: infer from defaults
    bool read_only = true;
};

// Parsed workflow definition. Immutable once parsed.
struct WorkflowData {
    std::string name;           // display name
    std::string workflow_id;    // file stem of the source
    std::string source_path;
    std::string source;         // "owner/repo/path@ref" when imported
    std::string tracker_id;
    std::string markdown;       // prompt body

    std::vector<std::string> triggers;  // event names under "on"
    std::vector<std::string> command;   // command names; non-empty for command triggers

    EngineConfig engine;
    std::optional<Permissions> permissions;
    std::string stop_time;
    std::string reaction;
    std::vector<std::string> roles = {"admin", "maintainer", "write"};
    nlohmann::json jobs = nlohmann::json::object();  // custom job fragments
    std::optional<GitHubToolConfig> github_tool;
    std::optional<SafeOutputsConfig> safe_outputs;

    std::string concurrency;    // explicit workflow-level group
    std::string if_condition;
    int timeout_minutes = 20;

    bool is_command_trigger() const { return !command.empty(); }

    // True when any trigger name contains fragment ("pull_request" matches pull_request_target)
    bool has_trigger(const std::string& fragment) const;
};

struct WorkflowParseResult {
    bool success = false;
    std::string error;
    WorkflowData data;
};

// Build WorkflowData from frontmatter already converted to JSON.
WorkflowParseResult parse_workflow_data(const nlohmann::json& frontmatter,
                                        const std::string& source_path,
                                        const std::string& markdown = "");

} // namespace warden::workflow
