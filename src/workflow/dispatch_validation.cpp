#include "workflow/dispatch_validation.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>
#include <spdlog/spdlog.h>
#include "core/paths.hpp"

namespace fs = std::filesystem;

namespace warden::workflow {

namespace {

std::vector<fs::path> search_dirs(const WorkflowData& data, const CompilerConfig& config) {
    std::vector<fs::path> dirs;
    auto add = [&dirs](const fs::path& dir) {
        if (dir.empty()) return;
        for (const auto& existing : dirs) {
            if (existing == dir) return;
        }
        dirs.push_back(dir);
    };

    if (!data.source_path.empty()) {
        add(fs::path(data.source_path).parent_path());
    }
    if (!config.workflows_dir.empty()) {
        add(config.workflows_dir);
    } else {
        fs::path start = data.source_path.empty() ? fs::path() : fs::path(data.source_path).parent_path();
        if (start.empty()) {
            std::error_code ec;
            start = fs::current_path(ec);
            if (ec) {
                spdlog::warn("dispatch-workflow: cannot resolve working directory: {}", ec.message());
                return dirs;
            }
        }
        auto root = core::paths::find_repository_root(start);
        if (root) {
            add(*root / ".github" / "workflows");
        }
    }
    return dirs;
}

std::optional<fs::path> find_in(const std::vector<fs::path>& dirs, const std::string& file_name) {
    std::error_code ec;
    for (const auto& dir : dirs) {
        fs::path candidate = dir / file_name;
        if (fs::is_regular_file(candidate, ec)) {
            return candidate;
        }
    }
    return std::nullopt;
}

bool supports_workflow_dispatch(const fs::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        spdlog::warn("Could not read {}", path.string());
        return false;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str().find("workflow_dispatch") != std::string::npos;
}

std::string empty_list_error() {
    return "dispatch-workflow must specify at least one workflow.\n\n"
           "Example configuration:\n"
           "safe-outputs:\n"
           "  dispatch-workflow:\n"
           "    workflows: [workflow-name-1, workflow-name-2]\n\n"
           "Use the workflow name without the .md extension.";
}

std::string self_reference_error(const std::string& name) {
    return "dispatch-workflow: self-reference not allowed: workflow '" + name +
           "' cannot dispatch itself. This would create infinite loops. "
           "Use a schedule trigger or workflow_dispatch with a separate workflow instead.";
}

std::string not_dispatchable_error(const std::string& name, const fs::path& path) {
    return "dispatch-workflow: workflow '" + name + "' (" + path.filename().string() +
           ") does not support workflow_dispatch. Add 'workflow_dispatch:' to its triggers and recompile.";
}

std::string not_compiled_error(const std::string& name) {
    return "dispatch-workflow: workflow '" + name + "' must be compiled first. "
           "The source file exists but the compiled .lock.yml file is missing.\n\n"
           "To fix:\n"
           "  1. Run: warden compile " + name + "\n"
           "  2. Commit the generated .lock.yml file\n"
           "  3. Make sure .lock.yml files are not excluded by .gitignore";
}

std::string not_found_error(const std::string& name, const std::vector<fs::path>& dirs) {
    std::string checked;
    for (const auto& dir : dirs) {
        for (const char* ext : {".md", ".lock.yml", ".yml"}) {
            checked += "  - " + (dir / (name + ext)).string() + "\n";
        }
    }
    if (checked.empty()) {
        checked = "  - " + name + ".md\n  - " + name + ".lock.yml\n  - " + name + ".yml\n";
    }
    return "dispatch-workflow: workflow '" + name + "' not found: it does not exist: "
           "check for the correct name and extension.\n\n"
           "Checked for:\n" + checked + "\n"
           "To fix:\n"
           "  1. Verify the workflow file exists in .github/workflows/\n"
           "  2. Names are case-sensitive\n"
           "  3. Use the workflow name without extension";
}

} // anonymous namespace

DispatchValidationResult validate_dispatch_workflow(const WorkflowData& data, const CompilerConfig& config) {
    DispatchValidationResult result;
    if (!data.safe_outputs || !data.safe_outputs->dispatch_workflow) {
        result.success = true;
        return result;
    }

    const auto& dispatch = *data.safe_outputs->dispatch_workflow;
    if (dispatch.workflows.empty()) {
        result.error = empty_list_error();
        return result;
    }

    const auto dirs = search_dirs(data, config);
    std::vector<std::string> errors;

    for (const auto& name : dispatch.workflows) {
        std::string error;
        if (name == data.workflow_id) {
            error = self_reference_error(name);
        } else if (auto lock = find_in(dirs, name + ".lock.yml")) {
            if (supports_workflow_dispatch(*lock)) result.workflow_files[name] = ".lock.yml";
            else error = not_dispatchable_error(name, *lock);
        } else if (auto yml = find_in(dirs, name + ".yml")) {
            if (supports_workflow_dispatch(*yml)) result.workflow_files[name] = ".yml";
            else error = not_dispatchable_error(name, *yml);
        } else if (find_in(dirs, name + ".md")) {
            error = not_compiled_error(name);
        } else {
            error = not_found_error(name, dirs);
        }

        if (error.empty()) {
            spdlog::debug("dispatch-workflow: '{}' resolved to {}", name, result.workflow_files[name]);
            continue;
        }
        if (config.fail_fast) {
            result.error = error;
            return result;
        }
        errors.push_back(error);
    }

    if (errors.size() == 1) {
        result.error = errors.front();
        return result;
    }
    if (!errors.empty()) {
        result.error = "Found " + std::to_string(errors.size()) + " dispatch-workflow errors:";
        for (size_t i = 0; i < errors.size(); ++i) {
            result.error += "\n\n" + std::to_string(i + 1) + ". " + errors[i];
        }
        return result;
    }

    result.success = true;
    return result;
}

} // namespace warden::workflow
