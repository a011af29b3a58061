#pragma once
#include <map>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "workflow/compiler_config.hpp"
#include "workflow/concurrency.hpp"
#include "workflow/engine.hpp"
#include "workflow/job.hpp"
#include "workflow/workflow_data.hpp"

namespace warden::workflow {

struct CompiledWorkflow {
    std::string name;
    std::vector<std::string> triggers;
    WorkflowConcurrency concurrency;
    JobGraph jobs;

    nlohmann::json to_json() const;
};

struct CompileResult {
    bool success = false;
    std::string error;
    CompiledWorkflow workflow;
};

struct JobResult {
    bool success = false;
    std::string error;
    Job job;
};

// User steps and outputs merged into the pre-activation job
struct PreActivationCustomFields {
    std::vector<nlohmann::json> steps;
    std::map<std::string, std::string> outputs;

    bool empty() const { return steps.empty() && outputs.empty(); }
};

struct CustomFieldsResult {
    bool success = false;
    std::string error;
    PreActivationCustomFields fields;
};

// Read jobs["pre-activation"]. Fails when steps is not an array or outputs is not a map.
CustomFieldsResult extract_pre_activation_custom_fields(const nlohmann::json& jobs);

// False for "roles: all" and for workflows triggered only by trusted events
bool needs_permission_check(const WorkflowData& data);

bool has_reaction(const WorkflowData& data);

// Write access the reaction step needs on the triggering entity; empty when
// no trigger carries a reactable entity.
Permissions reaction_permissions(const WorkflowData& data);

bool needs_pre_activation(const WorkflowData& data);

// Builds the job graph for one workflow. Holds no mutable state, so one
// instance may compile many workflows concurrently.
class Compiler {
public:
    explicit Compiler(CompilerConfig config,
                      std::shared_ptr<const EngineRegistry> engines = EngineRegistry::with_builtin_engines());

    CompileResult compile(const WorkflowData& data) const;

    JobResult build_pre_activation_job(const WorkflowData& data, bool check_permissions) const;
    Job build_activation_job(const WorkflowData& data, bool has_pre_activation) const;
    JobResult build_main_job(const WorkflowData& data, bool has_activation) const;

    // Explicit declaration as written; otherwise contents: read in dev mode only.
    Permissions main_job_permissions(const WorkflowData& data) const;

    McpServerSet mcp_servers(const WorkflowData& data, const Permissions& permissions) const;

    const CompilerConfig& config() const { return config_; }

private:
    CompilerConfig config_;
    std::shared_ptr<const EngineRegistry> engines_;
};

} // namespace warden::workflow
