#pragma once
#include <map>
#include <string>
#include "workflow/compiler_config.hpp"
#include "workflow/workflow_data.hpp"

namespace warden::workflow {

struct DispatchValidationResult {
    bool success = false;
    std::string error;
    std::map<std::string, std::string> workflow_files;  // name -> ".lock.yml" or ".yml"
};

// Check every dispatch-workflow target: not the workflow itself, present on
// disk, compiled, and dispatchable. Succeeds trivially without dispatch-workflow.
DispatchValidationResult validate_dispatch_workflow(const WorkflowData& data, const CompilerConfig& config);

} // namespace warden::workflow
