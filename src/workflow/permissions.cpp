#include "workflow/permissions.hpp"
#include <algorithm>
#include <sstream>
#include <spdlog/spdlog.h>

namespace warden::workflow {

const char* permission_scope_to_string(PermissionScope scope) {
    switch (scope) {
        case PermissionScope::ACTIONS:               return "actions";
        case PermissionScope::ATTESTATIONS:          return "attestations";
        case PermissionScope::CHECKS:                return "checks";
        case PermissionScope::CONTENTS:              return "contents";
        case PermissionScope::DEPLOYMENTS:           return "deployments";
        case PermissionScope::DISCUSSIONS:           return "discussions";
        case PermissionScope::ID_TOKEN:              return "id-token";
        case PermissionScope::ISSUES:                return "issues";
        case PermissionScope::METADATA:              return "metadata";
        case PermissionScope::MODELS:                return "models";
        case PermissionScope::PACKAGES:              return "packages";
        case PermissionScope::PAGES:                 return "pages";
        case PermissionScope::PULL_REQUESTS:         return "pull-requests";
        case PermissionScope::REPOSITORY_PROJECTS:   return "repository-projects";
        case PermissionScope::ORGANIZATION_PROJECTS: return "organization-projects";
        case PermissionScope::SECURITY_EVENTS:       return "security-events";
        case PermissionScope::STATUSES:              return "statuses";
        default: return "unknown";
    }
}

std::optional<PermissionScope> permission_scope_from_string(const std::string& str) {
    for (auto scope : all_permission_scopes()) {
        if (str == permission_scope_to_string(scope)) {
            return scope;
        }
    }
    return std::nullopt;
}

const char* permission_level_to_string(PermissionLevel level) {
    switch (level) {
        case PermissionLevel::READ:  return "read";
        case PermissionLevel::WRITE: return "write";
        default: return "none";
    }
}

std::optional<PermissionLevel> permission_level_from_string(const std::string& str) {
    if (str == "read") return PermissionLevel::READ;
    if (str == "write") return PermissionLevel::WRITE;
    if (str == "none") return PermissionLevel::NONE;
    return std::nullopt;
}

const std::vector<PermissionScope>& all_permission_scopes() {
    static const std::vector<PermissionScope> scopes = {
        PermissionScope::ACTIONS,
        PermissionScope::ATTESTATIONS,
        PermissionScope::CHECKS,
        PermissionScope::CONTENTS,
        PermissionScope::DEPLOYMENTS,
        PermissionScope::DISCUSSIONS,
        PermissionScope::ID_TOKEN,
        PermissionScope::ISSUES,
        PermissionScope::METADATA,
        PermissionScope::MODELS,
        PermissionScope::PACKAGES,
        PermissionScope::PAGES,
        PermissionScope::PULL_REQUESTS,
        PermissionScope::REPOSITORY_PROJECTS,
        PermissionScope::ORGANIZATION_PROJECTS,
        PermissionScope::SECURITY_EVENTS,
        PermissionScope::STATUSES,
    };
    return scopes;
}

const std::vector<PermissionScope>& workflow_permission_scopes() {
    static const std::vector<PermissionScope> scopes = [] {
        std::vector<PermissionScope> result;
        for (auto scope : all_permission_scopes()) {
            if (scope != PermissionScope::ORGANIZATION_PROJECTS) {
                result.push_back(scope);
            }
        }
        return result;
    }();
    return scopes;
}

Permissions Permissions::shorthand(const std::string& value) {
    Permissions perms;
    perms.shorthand_ = value;
    return perms;
}

Permissions Permissions::explicit_empty() {
    Permissions perms;
    perms.explicit_empty_ = true;
    return perms;
}

void Permissions::set(PermissionScope scope, PermissionLevel level) {
    scopes_[scope] = level;
}

void Permissions::set_all(PermissionLevel level) {
    all_ = level;
}

std::pair<PermissionLevel, bool> Permissions::get(PermissionScope scope) const {
    auto it = scopes_.find(scope);
    if (it != scopes_.end()) {
        return {it->second, true};
    }
    if (all_.has_value() && scope != PermissionScope::ORGANIZATION_PROJECTS) {
        return {*all_, true};
    }
    if (!shorthand_.empty() && scope != PermissionScope::ORGANIZATION_PROJECTS) {
        if (shorthand_ == "read-all" || shorthand_ == "read") return {PermissionLevel::READ, true};
        if (shorthand_ == "write-all" || shorthand_ == "write") return {PermissionLevel::WRITE, true};
    }
    return {PermissionLevel::NONE, false};
}

std::map<PermissionScope, PermissionLevel> Permissions::expanded() const {
    std::map<PermissionScope, PermissionLevel> result;
    if (all_.has_value() || !shorthand_.empty()) {
        for (auto scope : workflow_permission_scopes()) {
            auto [level, present] = get(scope);
            if (present) {
                result[scope] = level;
            }
        }
    }
    for (const auto& [scope, level] : scopes_) {
        result[scope] = level;
    }
    return result;
}

Permissions Permissions::merge(const Permissions& a, const Permissions& b) {
    Permissions result;
    result.scopes_ = a.expanded();
    for (const auto& [scope, level] : b.expanded()) {
        auto it = result.scopes_.find(scope);
        if (it == result.scopes_.end()) {
            result.scopes_[scope] = level;
        } else {
            it->second = max_permission_level(it->second, level);
        }
    }
    result.explicit_empty_ = result.scopes_.empty() && (a.explicit_empty_ || b.explicit_empty_);
    return result;
}

std::string Permissions::render() const {
    if (!shorthand_.empty()) {
        return shorthand_;
    }
    if (empty()) {
        return explicit_empty_ ? "{}" : "";
    }

    std::vector<std::pair<std::string, PermissionLevel>> lines;
    lines.reserve(scopes_.size());
    for (const auto& [scope, level] : scopes_) {
        lines.emplace_back(permission_scope_to_string(scope), level);
    }
    std::sort(lines.begin(), lines.end(),
              [](const auto& lhs, const auto& rhs) { return lhs.first < rhs.first; });

    std::ostringstream out;
    bool first = true;
    if (all_.has_value()) {
        out << "all: " << permission_level_to_string(*all_);
        first = false;
    }
    for (const auto& [name, level] : lines) {
        if (!first) out << "\n";
        out << name << ": " << permission_level_to_string(level);
        first = false;
    }
    return out.str();
}

bool Permissions::empty() const {
    return scopes_.empty() && !all_.has_value() && shorthand_.empty();
}

nlohmann::json Permissions::to_json() const {
    if (!shorthand_.empty()) {
        return shorthand_;
    }
    nlohmann::json j = nlohmann::json::object();
    if (all_.has_value()) {
        j["all"] = permission_level_to_string(*all_);
    }
    for (const auto& [scope, level] : scopes_) {
        j[permission_scope_to_string(scope)] = permission_level_to_string(level);
    }
    return j;
}

bool Permissions::operator==(const Permissions& other) const {
    return scopes_ == other.scopes_ && all_ == other.all_ &&
           shorthand_ == other.shorthand_ && explicit_empty_ == other.explicit_empty_;
}

std::optional<Permissions> parse_permissions(const nlohmann::json& value) {
    if (value.is_string()) {
        auto str = value.get<std::string>();
        if (str == "read-all" || str == "write-all" || str == "read" || str == "write") {
            return Permissions::shorthand(str);
        }
        spdlog::warn("Unknown permissions shorthand '{}', treating as no permissions", str);
        return Permissions::explicit_empty();
    }

    if (!value.is_object()) {
        return std::nullopt;
    }

    if (value.empty()) {
        return Permissions::explicit_empty();
    }

    Permissions perms;
    for (const auto& [key, level_value] : value.items()) {
        if (!level_value.is_string()) {
            spdlog::warn("Ignoring permission '{}': level must be a string", key);
            continue;
        }
        auto level = permission_level_from_string(level_value.get<std::string>());
        if (!level) {
            spdlog::warn("Ignoring permission '{}': unknown level '{}'", key, level_value.get<std::string>());
            continue;
        }
        if (key == "all") {
            perms.set_all(*level);
            continue;
        }
        auto scope = permission_scope_from_string(key);
        if (!scope) {
            spdlog::warn("Ignoring unknown permission scope '{}'", key);
            continue;
        }
        perms.set(*scope, *level);
    }
    return perms;
}

Permissions contents_read_permissions() {
    return PermissionsBuilder().with_contents(PermissionLevel::READ).build();
}

Permissions contents_read_issues_write_permissions() {
    return PermissionsBuilder()
        .with_contents(PermissionLevel::READ)
        .with_issues(PermissionLevel::WRITE)
        .build();
}

Permissions contents_read_pull_requests_write_permissions() {
    return PermissionsBuilder()
        .with_contents(PermissionLevel::READ)
        .with_pull_requests(PermissionLevel::WRITE)
        .build();
}

Permissions contents_read_discussions_write_permissions() {
    return PermissionsBuilder()
        .with_contents(PermissionLevel::READ)
        .with_discussions(PermissionLevel::WRITE)
        .build();
}

Permissions contents_read_security_events_write_actions_read_permissions() {
    return PermissionsBuilder()
        .with_contents(PermissionLevel::READ)
        .with_security_events(PermissionLevel::WRITE)
        .with_actions(PermissionLevel::READ)
        .build();
}

Permissions contents_write_pull_requests_write_permissions() {
    return PermissionsBuilder()
        .with_contents(PermissionLevel::WRITE)
        .with_pull_requests(PermissionLevel::WRITE)
        .build();
}

Permissions contents_read_issues_pull_requests_write_permissions() {
    return PermissionsBuilder()
        .with_contents(PermissionLevel::READ)
        .with_issues(PermissionLevel::WRITE)
        .with_pull_requests(PermissionLevel::WRITE)
        .build();
}

Permissions actions_write_permissions() {
    return PermissionsBuilder().with_actions(PermissionLevel::WRITE).build();
}

} // namespace warden::workflow
