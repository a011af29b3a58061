#include "workflow/toolsets.hpp"
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace warden::workflow {

namespace {

// Permission requirements of the GitHub tool-server toolsets.
const char* const kToolsetTable = R"json({
  "context": {
    "description": "Tools about the current user and GitHub context",
    "read_permissions": [],
    "write_permissions": [],
    "tools": ["get_me", "get_team_members", "get_teams"]
  },
  "repos": {
    "description": "Repository contents, branches, commits and releases",
    "read_permissions": ["contents"],
    "write_permissions": ["contents"],
    "tools": ["get_file_contents", "list_commits", "get_commit", "list_branches", "list_tags",
              "get_latest_release", "list_releases", "create_or_update_file", "push_files", "create_branch"]
  },
  "issues": {
    "description": "Issues and issue comments",
    "read_permissions": ["issues"],
    "write_permissions": ["issues"],
    "tools": ["issue_read", "list_issues", "search_issues", "list_issue_types",
              "issue_write", "add_issue_comment", "sub_issue_write"]
  },
  "pull_requests": {
    "description": "Pull requests, reviews and review comments",
    "read_permissions": ["pull-requests"],
    "write_permissions": ["pull-requests"],
    "tools": ["pull_request_read", "list_pull_requests", "search_pull_requests",
              "create_pull_request", "update_pull_request", "merge_pull_request",
              "pull_request_review_write"]
  },
  "actions": {
    "description": "Workflow runs, jobs and logs",
    "read_permissions": ["actions"],
    "write_permissions": ["actions"],
    "tools": ["list_workflows", "list_workflow_runs", "get_workflow_run", "list_workflow_jobs",
              "get_job_logs", "run_workflow", "rerun_workflow_run", "cancel_workflow_run"]
  },
  "code_security": {
    "description": "Code scanning alerts",
    "read_permissions": ["security-events"],
    "write_permissions": ["security-events"],
    "tools": ["list_code_scanning_alerts", "get_code_scanning_alert"]
  },
  "dependabot": {
    "description": "Dependabot alerts",
    "read_permissions": ["security-events"],
    "write_permissions": [],
    "tools": ["list_dependabot_alerts", "get_dependabot_alert"]
  },
  "discussions": {
    "description": "Discussions and discussion categories",
    "read_permissions": ["discussions"],
    "write_permissions": ["discussions"],
    "tools": ["list_discussions", "get_discussion", "get_discussion_comments", "list_discussion_categories"]
  },
  "experiments": {
    "description": "Experimental tools",
    "read_permissions": [],
    "write_permissions": [],
    "tools": []
  },
  "gists": {
    "description": "Gists of the authenticated user",
    "read_permissions": [],
    "write_permissions": [],
    "tools": ["list_gists", "create_gist", "update_gist"]
  },
  "labels": {
    "description": "Repository labels",
    "read_permissions": ["issues"],
    "write_permissions": ["issues"],
    "tools": ["get_label", "list_label", "label_write"]
  },
  "notifications": {
    "description": "Notifications of the authenticated user",
    "read_permissions": [],
    "write_permissions": [],
    "tools": ["list_notifications", "get_notification_details", "dismiss_notification"]
  },
  "orgs": {
    "description": "Organizations",
    "read_permissions": [],
    "write_permissions": [],
    "tools": ["search_orgs"]
  },
  "projects": {
    "description": "Projects",
    "read_permissions": ["repository-projects"],
    "write_permissions": ["repository-projects"],
    "tools": ["list_projects", "get_project", "list_project_items", "add_project_item"]
  },
  "secret_protection": {
    "description": "Secret scanning alerts",
    "read_permissions": ["security-events"],
    "write_permissions": ["security-events"],
    "tools": ["list_secret_scanning_alerts", "get_secret_scanning_alert"]
  },
  "security_advisories": {
    "description": "Security advisories",
    "read_permissions": ["security-events"],
    "write_permissions": ["security-events"],
    "tools": ["list_global_security_advisories", "list_repository_security_advisories"]
  },
  "stargazers": {
    "description": "Stars",
    "read_permissions": [],
    "write_permissions": [],
    "tools": ["list_starred_repositories", "star_repository", "unstar_repository"]
  },
  "users": {
    "description": "User search",
    "read_permissions": [],
    "write_permissions": [],
    "tools": ["search_users"]
  },
  "search": {
    "description": "Code, repository and user search",
    "read_permissions": [],
    "write_permissions": [],
    "tools": ["search_code", "search_repositories", "search_users"]
  }
})json";

std::vector<PermissionScope> parse_scopes(const json& list, const std::string& toolset) {
    std::vector<PermissionScope> scopes;
    for (const auto& item : list) {
        auto scope = permission_scope_from_string(item.get<std::string>());
        if (!scope) {
            spdlog::warn("Toolset {} references unknown scope '{}'", toolset, item.get<std::string>());
            continue;
        }
        scopes.push_back(*scope);
    }
    return scopes;
}

} // namespace

const std::vector<std::string>& default_github_toolsets() {
    static const std::vector<std::string> defaults = {"context", "repos", "issues", "pull_requests"};
    return defaults;
}

ToolsetInferenceEngine::ToolsetInferenceEngine()
    : registry_(registry()) {}

const ToolsetInferenceEngine::Registry& ToolsetInferenceEngine::registry() {
    static const Registry instance = load_registry();
    return instance;
}

ToolsetInferenceEngine::Registry ToolsetInferenceEngine::load_registry() {
    Registry reg;
    // ordered_json keeps the table order for all_toolsets()
    auto table = nlohmann::ordered_json::parse(kToolsetTable);
    for (const auto& [name, entry] : table.items()) {
        ToolsetDefinition def;
        def.name = name;
        def.description = entry.value("description", "");
        def.tools = entry.value("tools", std::vector<std::string>{});
        def.read_scopes = parse_scopes(entry.value("read_permissions", json::array()), name);
        def.write_scopes = parse_scopes(entry.value("write_permissions", json::array()), name);
        reg.index[name] = reg.definitions.size();
        reg.definitions.push_back(std::move(def));
    }
    spdlog::debug("Loaded {} toolset definitions", reg.definitions.size());
    return reg;
}

std::vector<std::string> ToolsetInferenceEngine::infer_from_toolsets(const Permissions* permissions,
                                                                     const std::vector<std::string>& toolsets,
                                                                     bool read_only) const {
    spdlog::debug("Inferring compatible toolsets from {} candidates (read-only: {})", toolsets.size(), read_only);

    std::vector<std::string> compatible;
    compatible.reserve(toolsets.size());
    for (const auto& name : toolsets) {
        const auto* def = get_toolset_permissions(name);
        if (def == nullptr) {
            spdlog::warn("Toolset {} is not in the registry, skipping", name);
            continue;
        }
        if (is_compatible(*def, permissions, read_only)) {
            compatible.push_back(name);
        }
    }

    spdlog::debug("Inferred {} compatible toolsets from {} candidates", compatible.size(), toolsets.size());
    return compatible;
}

std::vector<std::string> ToolsetInferenceEngine::infer_from_defaults(const Permissions* permissions,
                                                                     bool read_only) const {
    return infer_from_toolsets(permissions, default_github_toolsets(), read_only);
}

const ToolsetDefinition* ToolsetInferenceEngine::get_toolset_permissions(const std::string& name) const {
    auto it = registry_.index.find(name);
    if (it == registry_.index.end()) {
        return nullptr;
    }
    return &registry_.definitions[it->second];
}

std::vector<std::string> ToolsetInferenceEngine::all_toolsets() const {
    std::vector<std::string> names;
    names.reserve(registry_.definitions.size());
    for (const auto& def : registry_.definitions) {
        names.push_back(def.name);
    }
    return names;
}

bool ToolsetInferenceEngine::is_compatible(const ToolsetDefinition& toolset,
                                           const Permissions* permissions,
                                           bool read_only) const {
    auto granted = [permissions](PermissionScope scope) {
        if (permissions == nullptr) return PermissionLevel::NONE;
        return permissions->get(scope).first;
    };

    for (auto scope : toolset.read_scopes) {
        if (!permission_satisfies(granted(scope), PermissionLevel::READ)) {
            spdlog::debug("Toolset {} incompatible: missing read permission {}",
                          toolset.name, permission_scope_to_string(scope));
            return false;
        }
    }

    if (!read_only) {
        for (auto scope : toolset.write_scopes) {
            if (!permission_satisfies(granted(scope), PermissionLevel::WRITE)) {
                spdlog::debug("Toolset {} incompatible: missing write permission {}",
                              toolset.name, permission_scope_to_string(scope));
                return false;
            }
        }
    }
    return true;
}

} // namespace warden::workflow
