#include "workflow/compiler.hpp"
#include <algorithm>
#include <set>
#include <spdlog/spdlog.h>
#include "workflow/dispatch_validation.hpp"
#include "workflow/expressions.hpp"
#include "workflow/safe_output_jobs.hpp"
#include "workflow/steps.hpp"
#include "workflow/toolsets.hpp"

using json = nlohmann::json;

namespace warden::workflow {

namespace {

// Events only repository writers can cause
const std::set<std::string>& trusted_events() {
    static const std::set<std::string> events = {
        "schedule", "workflow_dispatch", "workflow_run", "merge_group",
    };
    return events;
}

std::string join(const std::vector<std::string>& items, const char* sep) {
    std::string result;
    for (const auto& item : items) {
        if (!result.empty()) result += sep;
        result += item;
    }
    return result;
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

const json* pre_activation_entry(const json& jobs) {
    if (!jobs.is_object()) return nullptr;
    for (const char* key : {"pre-activation", "pre_activation"}) {
        auto it = jobs.find(key);
        if (it != jobs.end()) return &*it;
    }
    return nullptr;
}

bool is_pre_activation_key(const std::string& key) {
    return key == "pre-activation" || key == "pre_activation";
}

// Jobs declared under "jobs:" besides the pre-activation fragment
bool build_custom_jobs(const json& jobs, std::vector<Job>& out, std::string& error) {
    if (!jobs.is_object()) return true;
    for (auto it = jobs.begin(); it != jobs.end(); ++it) {
        if (is_pre_activation_key(it.key())) continue;

        const json& value = it.value();
        if (!value.is_object()) {
            error = "jobs." + it.key() + " must be an object";
            return false;
        }

        Job job;
        job.name = it.key();
        job.runs_on = "ubuntu-latest";
        if (value.contains("runs-on") && value["runs-on"].is_string()) job.runs_on = value["runs-on"].get<std::string>();
        if (value.contains("needs")) job.needs = string_list(value["needs"]);
        if (value.contains("if") && value["if"].is_string()) job.condition = value["if"].get<std::string>();
        if (value.contains("permissions")) {
            auto perms = parse_permissions(value["permissions"]);
            if (!perms) {
                error = "jobs." + it.key() + ".permissions must be a string or an object";
                return false;
            }
            job.permissions = *perms;
        }
        if (value.contains("steps")) {
            if (!value["steps"].is_array()) {
                error = "jobs." + it.key() + ".steps must be an array";
                return false;
            }
            for (const auto& step : value["steps"]) {
                job.steps.push_back(step);
            }
        }
        if (value.contains("outputs") && value["outputs"].is_object()) {
            for (auto out_it = value["outputs"].begin(); out_it != value["outputs"].end(); ++out_it) {
                if (out_it->is_string()) job.outputs[out_it.key()] = out_it->get<std::string>();
            }
        }
        out.push_back(std::move(job));
    }
    return true;
}

std::vector<std::string> expand_toolsets(const std::vector<std::string>& names,
                                         const ToolsetInferenceEngine& inference) {
    std::vector<std::string> expanded;
    auto add = [&expanded](const std::string& name) {
        if (std::find(expanded.begin(), expanded.end(), name) == expanded.end()) {
            expanded.push_back(name);
        }
    };
    for (const auto& name : names) {
        if (name == "default") {
            for (const auto& d : default_github_toolsets()) add(d);
        } else if (name == "all") {
            for (const auto& a : inference.all_toolsets()) add(a);
        } else {
            add(name);
        }
    }
    return expanded;
}

json prompt_step(const WorkflowData& data) {
    return {
        {"name", "Create prompt"},
        {"env", {{"GH_AW_PROMPT", kPromptPath}}},
        {"run", "mkdir -p \"$(dirname \"$GH_AW_PROMPT\")\"\n"
                "cat << 'PROMPT_EOF' > \"$GH_AW_PROMPT\"\n" + data.markdown + "\nPROMPT_EOF"},
    };
}

json mcp_setup_step(const json& config) {
    return {
        {"name", "Setup MCPs"},
        {"env", {{"GITHUB_MCP_SERVER_TOKEN", "${{ secrets.GH_AW_GITHUB_TOKEN || secrets.GITHUB_TOKEN }}"}}},
        {"run", "mkdir -p \"$(dirname " + std::string(kMcpConfigPath) + ")\"\n"
                "cat << 'MCP_EOF' > " + std::string(kMcpConfigPath) + "\n" + config.dump(2) + "\nMCP_EOF"},
    };
}

} // anonymous namespace

json CompiledWorkflow::to_json() const {
    json concurrency_json = {{"group", concurrency.group}};
    if (concurrency.cancel_in_progress) {
        concurrency_json["cancel-in-progress"] = true;
    }
    return {
        {"name", name},
        {"on", triggers},
        {"permissions", json::object()},
        {"concurrency", concurrency_json},
        {"jobs", jobs.to_json()},
    };
}

CustomFieldsResult extract_pre_activation_custom_fields(const json& jobs) {
    CustomFieldsResult result;
    const json* entry = pre_activation_entry(jobs);
    if (!entry || entry->is_null()) {
        result.success = true;
        return result;
    }
    if (!entry->is_object()) {
        result.error = "jobs.pre-activation must be an object";
        return result;
    }

    if (entry->contains("steps")) {
        const json& steps = (*entry)["steps"];
        if (!steps.is_array()) {
            result.error = "jobs.pre-activation.steps must be an array";
            return result;
        }
        for (const auto& step : steps) {
            result.fields.steps.push_back(step);
        }
    }

    if (entry->contains("outputs")) {
        const json& outputs = (*entry)["outputs"];
        if (!outputs.is_object()) {
            result.error = "jobs.pre-activation.outputs must be an object";
            return result;
        }
        for (auto it = outputs.begin(); it != outputs.end(); ++it) {
            if (!it->is_string()) {
                result.error = "jobs.pre-activation.outputs." + it.key() + " must be a string";
                return result;
            }
            result.fields.outputs[it.key()] = it->get<std::string>();
        }
    }

    result.success = true;
    return result;
}

bool needs_permission_check(const WorkflowData& data) {
    if (std::find(data.roles.begin(), data.roles.end(), "all") != data.roles.end()) {
        return false;
    }
    if (data.is_command_trigger()) {
        return true;
    }
    for (const auto& trigger : data.triggers) {
        if (!trusted_events().count(trigger)) {
            return true;
        }
    }
    return false;
}

bool has_reaction(const WorkflowData& data) {
    return !data.reaction.empty() && data.reaction != "none";
}

Permissions reaction_permissions(const WorkflowData& data) {
    PermissionsBuilder builder;
    if (data.is_command_trigger() || data.has_trigger("issue")) {
        builder.with_issues(PermissionLevel::WRITE);
    }
    if (data.is_command_trigger() || data.has_trigger("pull_request")) {
        builder.with_pull_requests(PermissionLevel::WRITE);
    }
    if (data.has_trigger("discussion")) {
        builder.with_discussions(PermissionLevel::WRITE);
    }
    return builder.build();
}

bool needs_pre_activation(const WorkflowData& data) {
    if (needs_permission_check(data) || !data.stop_time.empty() || has_reaction(data)) {
        return true;
    }
    // A malformed fragment still routes through the builder so the error surfaces
    auto custom = extract_pre_activation_custom_fields(data.jobs);
    return !custom.success || !custom.fields.empty();
}

Compiler::Compiler(CompilerConfig config, std::shared_ptr<const EngineRegistry> engines)
    : config_(std::move(config)), engines_(std::move(engines)) {
    if (!engines_) {
        engines_ = EngineRegistry::with_builtin_engines();
    }
}

JobResult Compiler::build_pre_activation_job(const WorkflowData& data, bool check_permissions) const {
    JobResult result;
    auto custom = extract_pre_activation_custom_fields(data.jobs);
    if (!custom.success) {
        result.error = custom.error;
        return result;
    }

    Job& job = result.job;
    job.name = kPreActivationJobName;
    job.runs_on = "ubuntu-slim";

    if (config_.action_mode == ActionMode::DEV) {
        job.permissions = contents_read_permissions();
    }

    job.steps = setup_steps(config_);
    job.steps.insert(job.steps.end(), custom.fields.steps.begin(), custom.fields.steps.end());

    std::vector<std::string> gates;
    if (check_permissions) {
        job.steps.push_back(github_script_step(
            "Check team membership for workflow", "check_membership", "check_membership", "",
            {{"GH_AW_REQUIRED_ROLES", join(data.roles, ",")}}));
        gates.push_back(step_output("check_membership", "is_team_member") + " == 'true'");
    }

    if (!data.stop_time.empty()) {
        job.steps.push_back(github_script_step(
            "Check stop-time limit", "check_stop_time", "check_stop_time", "",
            {{"GH_AW_STOP_TIME", data.stop_time}, {"GH_AW_WORKFLOW_NAME", data.name}}));
        gates.push_back(step_output("check_stop_time", "stop_time_ok") + " == 'true'");
    }

    if (has_reaction(data)) {
        Permissions reaction_perms = reaction_permissions(data);
        if (reaction_perms.empty()) {
            spdlog::warn("{}: reaction '{}' ignored, no trigger carries a reactable item",
                         data.workflow_id, data.reaction);
        } else {
            job.permissions = Permissions::merge(job.permissions, reaction_perms);
            job.steps.push_back(github_script_step(
                "Add " + data.reaction + " reaction to the triggering item", "react", "add_reaction", "",
                {{"GH_AW_REACTION", data.reaction}, {"GH_AW_WORKFLOW_NAME", data.name}}));
        }
    }

    job.outputs["activated"] = gates.empty() ? "true" : wrap_expression(expr_and(gates));
    for (const auto& [key, value] : custom.fields.outputs) {
        if (key == "activated") {
            spdlog::warn("jobs.pre-activation.outputs.activated is reserved, ignoring");
            continue;
        }
        job.outputs[key] = value;
    }

    result.success = true;
    return result;
}

Job Compiler::build_activation_job(const WorkflowData& data, bool has_pre_activation) const {
    Job job;
    job.name = kActivationJobName;
    job.runs_on = "ubuntu-slim";
    job.permissions = contents_read_permissions();

    std::vector<std::string> conditions;
    if (has_pre_activation) {
        job.needs.push_back(kPreActivationJobName);
        conditions.push_back(needs_output(kPreActivationJobName, "activated") + " == 'true'");
    }

    const bool workflow_run = data.has_trigger("workflow_run");
    if (workflow_run) {
        // Runs triggered by forks must not reach the agent
        conditions.push_back("github.event_name != 'workflow_run' || "
                             "github.event.workflow_run.repository.id == github.repository_id");
    }
    conditions.push_back(data.if_condition);
    job.condition = expr_and(conditions);

    job.steps = setup_steps(config_);
    job.steps.push_back(github_script_step(
        "Check workflow file timestamps", "check_workflow_timestamp", "check_workflow_timestamp_api", "",
        {{"GH_AW_WORKFLOW_FILE", data.workflow_id + ".lock.yml"}}));
    if (workflow_run) {
        job.steps.push_back(github_script_step(
            "Validate workflow_run repository", "check_workflow_run_repository",
            "check_workflow_run_repository", ""));
    }
    return job;
}

Permissions Compiler::main_job_permissions(const WorkflowData& data) const {
    if (data.permissions) {
        return *data.permissions;
    }
    if (config_.action_mode == ActionMode::DEV) {
        return contents_read_permissions();
    }
    return Permissions();
}

McpServerSet Compiler::mcp_servers(const WorkflowData& data, const Permissions& permissions) const {
    McpServerSet servers;
    servers.safe_outputs = data.safe_outputs.has_value();
    if (!data.github_tool) {
        return servers;
    }

    ToolsetInferenceEngine inference;
    servers.github = true;
    servers.github_read_only = data.github_tool->read_only;
    if (data.github_tool->toolsets.empty()) {
        servers.github_toolsets = inference.infer_from_defaults(&permissions, servers.github_read_only);
    } else {
        servers.github_toolsets = inference.infer_from_toolsets(
            &permissions, expand_toolsets(data.github_tool->toolsets, inference), servers.github_read_only);
    }
    spdlog::debug("{}: github toolsets [{}]", data.workflow_id, join(servers.github_toolsets, ", "));
    return servers;
}

JobResult Compiler::build_main_job(const WorkflowData& data, bool has_activation) const {
    JobResult result;
    auto engine = engines_->get(data.engine.id);
    if (!engine) {
        result.error = "unknown engine '" + data.engine.id + "' (available: " + join(engines_->ids(), ", ") + ")";
        return result;
    }

    Job& job = result.job;
    job.name = kAgentJobName;
    job.runs_on = "ubuntu-latest";
    job.permissions = main_job_permissions(data);
    job.concurrency_group = build_job_group_key(data);
    job.timeout_minutes = data.timeout_minutes;
    if (has_activation) {
        job.needs.push_back(kActivationJobName);
    }

    job.steps = setup_steps(config_);
    if (permission_satisfies(job.permissions.get(PermissionScope::CONTENTS).first, PermissionLevel::READ)) {
        job.steps.push_back(checkout_step());
    }
    job.steps.push_back(prompt_step(data));
    for (auto& step : engine->installation_steps(data)) {
        job.steps.push_back(std::move(step));
    }
    job.steps.push_back(mcp_setup_step(engine->render_mcp_config(mcp_servers(data, job.permissions))));
    for (auto& step : engine->execution_steps(data, kAgentLogPath)) {
        job.steps.push_back(std::move(step));
    }

    if (data.safe_outputs) {
        job.steps.push_back(github_script_step(
            "Ingest agent output", "collect_output", "collect_ndjson_output", "",
            {{"GH_AW_SAFE_OUTPUTS", kSafeOutputsPath},
             {"GH_AW_ALLOWED_SAFE_OUTPUTS", join(data.safe_outputs->enabled_types(), ",")}}));
        job.steps.push_back(upload_artifact_step("Upload agent output", kAgentOutputArtifact,
                                                 std::string(kAgentOutputDir) + kAgentOutputArtifact));
        job.outputs["output"] = wrap_expression(step_output("collect_output", "output"));
        job.outputs["output_types"] = wrap_expression(step_output("collect_output", "output_types"));
    }
    job.steps.push_back(upload_artifact_step("Upload agent logs", "agent-stdio.log", kAgentLogPath));

    result.success = true;
    return result;
}

CompileResult Compiler::compile(const WorkflowData& input) const {
    CompileResult result;
    spdlog::info("Compiling workflow '{}' ({} mode)", input.workflow_id, action_mode_to_string(config_.action_mode));

    if (!engines_->get(input.engine.id)) {
        result.error = "unknown engine '" + input.engine.id + "' (available: " + join(engines_->ids(), ", ") + ")";
        return result;
    }

    WorkflowData data = input;
    auto dispatch = validate_dispatch_workflow(data, config_);
    if (!dispatch.success) {
        result.error = dispatch.error;
        return result;
    }
    if (data.safe_outputs && data.safe_outputs->dispatch_workflow) {
        data.safe_outputs->dispatch_workflow->workflow_files = dispatch.workflow_files;
    }

    auto& compiled = result.workflow;
    compiled.name = data.name;
    compiled.triggers = data.triggers;
    compiled.concurrency = build_workflow_concurrency(data);

    auto add = [&](Job job) {
        std::string name = job.name;
        if (!compiled.jobs.add_job(std::move(job))) {
            result.error = "duplicate job '" + name + "'";
            return false;
        }
        return true;
    };

    const bool has_pre_activation = needs_pre_activation(data);
    if (has_pre_activation) {
        auto pre = build_pre_activation_job(data, needs_permission_check(data));
        if (!pre.success) {
            result.error = pre.error;
            return result;
        }
        if (!add(std::move(pre.job))) return result;
    }

    if (!add(build_activation_job(data, has_pre_activation))) return result;

    auto agent = build_main_job(data, true);
    if (!agent.success) {
        result.error = agent.error;
        return result;
    }
    if (!add(std::move(agent.job))) return result;

    SafeOutputBuildContext ctx{data, config_};
    auto safe_jobs = build_safe_output_jobs(ctx);
    std::vector<std::string> safe_job_names;
    for (auto& job : safe_jobs) {
        safe_job_names.push_back(job.name);
        if (!add(std::move(job))) return result;
    }

    std::vector<Job> custom_jobs;
    if (!build_custom_jobs(data.jobs, custom_jobs, result.error)) {
        return result;
    }
    for (auto& job : custom_jobs) {
        if (!add(std::move(job))) return result;
    }

    auto validation = compiled.jobs.validate();
    if (!validation.success) {
        result.error = validation.error;
        return result;
    }
    for (const auto& name : safe_job_names) {
        if (!compiled.jobs.depends_on(name, kAgentJobName)) {
            result.error = "safe-output job '" + name + "' does not depend on the agent job";
            return result;
        }
    }

    spdlog::info("Compiled '{}': {} jobs", data.workflow_id, compiled.jobs.size());
    result.success = true;
    return result;
}

} // namespace warden::workflow
