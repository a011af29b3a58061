#pragma once
#include <string>
#include <vector>
#include "workflow/workflow_data.hpp"

namespace warden::workflow {

struct WorkflowConcurrency {
    std::string group;
    bool cancel_in_progress = false;
};

// Trigger classification
bool is_pull_request_workflow(const WorkflowData& data);
bool is_issue_workflow(const WorkflowData& data);
bool is_discussion_workflow(const WorkflowData& data);
bool is_push_workflow(const WorkflowData& data);

// Issue, pull request, discussion, push or command triggers
bool has_special_triggers(const WorkflowData& data);

// Ordered parts of the workflow-level group key
std::vector<std::string> build_group_keys(const WorkflowData& data, bool is_command_trigger);

// Parts joined with '-'
std::string build_group(const WorkflowData& data, bool is_command_trigger);

bool should_cancel_in_progress(const WorkflowData& data, bool is_command_trigger);

// Workflow-level concurrency; an explicit group in the input wins.
WorkflowConcurrency build_workflow_concurrency(const WorkflowData& data);

// Job-level group for the agent job, empty when none applies.
std::string build_job_group_key(const WorkflowData& data);

} // namespace warden::workflow
