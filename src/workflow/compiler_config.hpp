#pragma once
#include <filesystem>
#include <string>

namespace warden::workflow {

// Where the generated setup steps load their helper scripts from
enum class ActionMode {
    DEV,      // local ./actions checkout, needs contents: read
    RELEASE   // published action pinned to the compiler version
};

inline const char* action_mode_to_string(ActionMode mode) {
    switch (mode) {
        case ActionMode::DEV: return "dev";
        default: return "release";
    }
}

inline ActionMode action_mode_from_string(const std::string& str) {
    if (str == "dev" || str == "development" || str == "script") return ActionMode::DEV;
    return ActionMode::RELEASE;
}

// Everything that affects compiled output besides the workflow itself.
// Passed by value into the compiler; there is no process-wide build state.
struct CompilerConfig {
    ActionMode action_mode = ActionMode::RELEASE;
    std::string version = "dev";
    std::string action_repo = "github/gh-aw";
    std::filesystem::path workflows_dir;   // empty: <repo root>/.github/workflows
    bool fail_fast = true;                  // stop at the first dispatch-workflow error
};

} // namespace warden::workflow
