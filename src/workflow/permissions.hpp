#pragma once
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace warden::workflow {

// Capability domains a job token can be granted
enum class PermissionScope {
    ACTIONS,
    ATTESTATIONS,
    CHECKS,
    CONTENTS,
    DEPLOYMENTS,
    DISCUSSIONS,
    ID_TOKEN,
    ISSUES,
    METADATA,
    MODELS,
    PACKAGES,
    PAGES,
    PULL_REQUESTS,
    REPOSITORY_PROJECTS,
    ORGANIZATION_PROJECTS,  // GitHub App tokens only, never expanded from shorthand
    SECURITY_EVENTS,
    STATUSES
};

// Ordered: NONE < READ < WRITE
enum class PermissionLevel {
    NONE = 0,
    READ = 1,
    WRITE = 2
};

const char* permission_scope_to_string(PermissionScope scope);
std::optional<PermissionScope> permission_scope_from_string(const std::string& str);

const char* permission_level_to_string(PermissionLevel level);
std::optional<PermissionLevel> permission_level_from_string(const std::string& str);

// Every scope, in declaration order
const std::vector<PermissionScope>& all_permission_scopes();

// Scopes that "read-all" / "write-all" / "all:" expand to
const std::vector<PermissionScope>& workflow_permission_scopes();

// True when granted satisfies required (WRITE satisfies READ, never the reverse).
inline bool permission_satisfies(PermissionLevel granted, PermissionLevel required) {
    return static_cast<int>(granted) >= static_cast<int>(required);
}

inline PermissionLevel max_permission_level(PermissionLevel a, PermissionLevel b) {
    return permission_satisfies(a, b) ? a : b;
}

class Permissions {
public:
    Permissions() = default;

    // "read-all" or "write-all"
    static Permissions shorthand(const std::string& value);

    // Explicitly declared empty set ("permissions: {}")
    static Permissions explicit_empty();

    void set(PermissionScope scope, PermissionLevel level);
    void set_all(PermissionLevel level);

    // Level granted for scope, and whether anything granted it at all.
    std::pair<PermissionLevel, bool> get(PermissionScope scope) const;

    // Per-scope maximum of both sets; shorthand and "all:" are expanded first.
    static Permissions merge(const Permissions& a, const Permissions& b);

    // Deterministic text: shorthand as-is; otherwise "all: <level>" then
    // "scope: level" lines sorted by scope name. "{}" for an explicit empty set.
    std::string render() const;

    bool empty() const;
    bool is_shorthand() const { return !shorthand_.empty(); }
    bool is_explicit_empty() const { return explicit_empty_; }
    size_t size() const { return scopes_.size(); }

    const std::map<PermissionScope, PermissionLevel>& scopes() const { return scopes_; }

    nlohmann::json to_json() const;

    bool operator==(const Permissions& other) const;
    bool operator!=(const Permissions& other) const { return !(*this == other); }

private:
    std::map<PermissionScope, PermissionLevel> scopes_;
    std::optional<PermissionLevel> all_;
    std::string shorthand_;
    bool explicit_empty_ = false;

    // Concrete scope map with shorthand and "all:" folded in
    std::map<PermissionScope, PermissionLevel> expanded() const;
};

// Parse a "permissions" frontmatter value: a shorthand string or a scope map.
// Unknown scopes and levels are logged and skipped; returns nullopt only for
// values of the wrong JSON type.
std::optional<Permissions> parse_permissions(const nlohmann::json& value);

// Accumulator with chained setters
class PermissionsBuilder {
public:
    PermissionsBuilder& with(PermissionScope scope, PermissionLevel level) {
        perms_.set(scope, level);
        return *this;
    }
    PermissionsBuilder& with_actions(PermissionLevel level) { return with(PermissionScope::ACTIONS, level); }
    PermissionsBuilder& with_checks(PermissionLevel level) { return with(PermissionScope::CHECKS, level); }
    PermissionsBuilder& with_contents(PermissionLevel level) { return with(PermissionScope::CONTENTS, level); }
    PermissionsBuilder& with_discussions(PermissionLevel level) { return with(PermissionScope::DISCUSSIONS, level); }
    PermissionsBuilder& with_id_token(PermissionLevel level) { return with(PermissionScope::ID_TOKEN, level); }
    PermissionsBuilder& with_issues(PermissionLevel level) { return with(PermissionScope::ISSUES, level); }
    PermissionsBuilder& with_pull_requests(PermissionLevel level) { return with(PermissionScope::PULL_REQUESTS, level); }
    PermissionsBuilder& with_security_events(PermissionLevel level) { return with(PermissionScope::SECURITY_EVENTS, level); }
    PermissionsBuilder& with_statuses(PermissionLevel level) { return with(PermissionScope::STATUSES, level); }

    Permissions build() const { return perms_; }

private:
    Permissions perms_;
};

// Minimal grants used by job builders
Permissions contents_read_permissions();
Permissions contents_read_issues_write_permissions();
Permissions contents_read_pull_requests_write_permissions();
Permissions contents_read_discussions_write_permissions();
Permissions contents_read_security_events_write_actions_read_permissions();
Permissions contents_write_pull_requests_write_permissions();
Permissions contents_read_issues_pull_requests_write_permissions();
Permissions actions_write_permissions();

} // namespace warden::workflow
