#pragma once
#include <string>
#include <unordered_map>
#include <vector>
#include "workflow/permissions.hpp"

namespace warden::workflow {

// A named bundle of GitHub tool-server operations and the scopes it needs
struct ToolsetDefinition {
    std::string name;
    std::string description;
    std::vector<std::string> tools;
    std::vector<PermissionScope> read_scopes;
    std::vector<PermissionScope> write_scopes;
};

// Toolsets enabled when a workflow does not list any
const std::vector<std::string>& default_github_toolsets();

// Decides which toolsets a job token can actually serve. The registry is
// shared, immutable and parsed once from the embedded table.
class ToolsetInferenceEngine {
public:
    ToolsetInferenceEngine();

    // Compatible subset of toolsets, in input order. A null permissions
    // pointer is treated as every scope at NONE.
    std::vector<std::string> infer_from_toolsets(const Permissions* permissions,
                                                 const std::vector<std::string>& toolsets,
                                                 bool read_only) const;

    std::vector<std::string> infer_from_defaults(const Permissions* permissions, bool read_only) const;

    // nullptr for names the registry does not know
    const ToolsetDefinition* get_toolset_permissions(const std::string& name) const;

    // Registry names in table order
    std::vector<std::string> all_toolsets() const;

private:
    struct Registry {
        std::vector<ToolsetDefinition> definitions;
        std::unordered_map<std::string, size_t> index;
    };

    static const Registry& registry();
    static Registry load_registry();

    bool is_compatible(const ToolsetDefinition& toolset, const Permissions* permissions, bool read_only) const;

    const Registry& registry_;
};

} // namespace warden::workflow
