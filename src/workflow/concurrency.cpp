#include "workflow/concurrency.hpp"
#include <spdlog/spdlog.h>

namespace warden::workflow {

namespace {

constexpr const char* kGroupNamespace = "gh-aw";
constexpr const char* kWorkflowExpression = "${{ github.workflow }}";
constexpr const char* kThreadNumberExpression =
    "${{ github.event.issue.number || github.event.pull_request.number }}";

} // anonymous namespace

bool is_pull_request_workflow(const WorkflowData& data) {
    return data.has_trigger("pull_request");
}

bool is_issue_workflow(const WorkflowData& data) {
    // issue_comment counts as an issue event
    return data.has_trigger("issue");
}

bool is_discussion_workflow(const WorkflowData& data) {
    return data.has_trigger("discussion");
}

bool is_push_workflow(const WorkflowData& data) {
    for (const auto& trigger : data.triggers) {
        if (trigger == "push") return true;
    }
    return false;
}

bool has_special_triggers(const WorkflowData& data) {
    return data.is_command_trigger() ||
           is_issue_workflow(data) ||
           is_pull_request_workflow(data) ||
           is_discussion_workflow(data) ||
           is_push_workflow(data);
}

std::vector<std::string> build_group_keys(const WorkflowData& /*data*/, bool is_command_trigger) {
    std::vector<std::string> keys = {kGroupNamespace, kWorkflowExpression};
    if (is_command_trigger) {
        keys.push_back(kThreadNumberExpression);
    }
    return keys;
}

std::string build_group(const WorkflowData& data, bool is_command_trigger) {
    std::string group;
    for (const auto& key : build_group_keys(data, is_command_trigger)) {
        if (!group.empty()) group += "-";
        group += key;
    }
    return group;
}

bool should_cancel_in_progress(const WorkflowData& data, bool is_command_trigger) {
    return !is_command_trigger && is_pull_request_workflow(data);
}

WorkflowConcurrency build_workflow_concurrency(const WorkflowData& data) {
    WorkflowConcurrency concurrency;
    if (!data.concurrency.empty()) {
        spdlog::debug("Using explicit concurrency group '{}'", data.concurrency);
        concurrency.group = data.concurrency;
        return concurrency;
    }
    bool command = data.is_command_trigger();
    concurrency.group = build_group(data, command);
    concurrency.cancel_in_progress = should_cancel_in_progress(data, command);
    return concurrency;
}

std::string build_job_group_key(const WorkflowData& data) {
    if (!data.engine.concurrency.empty()) {
        return data.engine.concurrency;
    }
    if (has_special_triggers(data) || data.engine.id.empty()) {
        return "";
    }
    return std::string(kGroupNamespace) + "-" + data.engine.id + "-" + kWorkflowExpression;
}

} // namespace warden::workflow
