#pragma once
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "workflow/compiler_config.hpp"
#include "workflow/job.hpp"
#include "workflow/workflow_data.hpp"

namespace warden::workflow {

// Inputs shared by every safe-output job builder
struct SafeOutputBuildContext {
    const WorkflowData& data;
    const CompilerConfig& config;
    std::string main_job_name = kAgentJobName;
};

// Per-kind description handed to build_safe_output_job
struct SafeOutputJobConfig {
    std::string job_name;
    std::string step_name;
    std::string step_id;
    std::string script_name;
    std::string output_type;                    // tag the main job emits
    std::map<std::string, std::string> env;
    Permissions permissions;
    std::map<std::string, std::string> outputs;
    std::string condition;                      // ANDed with the output-type gate
    std::vector<nlohmann::json> pre_steps;
    std::vector<nlohmann::json> post_steps;
    std::string token;                          // empty: global or default token
    bool staged = false;                        // per-kind; the global flag also applies
    std::string target_repo;
    std::vector<std::string> needs;             // in addition to the main job
};

// Common job shape: download the agent output, set up scripts, run one script.
Job build_safe_output_job(const SafeOutputBuildContext& ctx, const SafeOutputJobConfig& cfg);

// GH_AW_WORKFLOW_NAME plus source and tracker id when set
std::map<std::string, std::string> safe_output_metadata_env(const WorkflowData& data);

// Per-kind token, else the global safe-outputs token, else the default secret chain.
std::string safe_output_token(const SafeOutputsConfig* outputs, const std::string& kind_token);

// Target-repo and allowed-repos env shared by cross-repository kinds
void add_target_repo_env(std::map<std::string, std::string>& env, const std::string& target_repo,
                         const std::vector<std::string>& allowed_repos);

Job build_create_issue_job(const SafeOutputBuildContext& ctx, const CreateIssueConfig& cfg);
Job build_create_discussion_job(const SafeOutputBuildContext& ctx, const CreateDiscussionConfig& cfg);
Job build_create_pull_request_job(const SafeOutputBuildContext& ctx, const CreatePullRequestConfig& cfg);

// created_jobs: names of create_* jobs already in the graph, wired as extra needs.
Job build_add_comment_job(const SafeOutputBuildContext& ctx, const AddCommentConfig& cfg,
                          const std::vector<std::string>& created_jobs);

Job build_submit_pull_request_review_job(const SafeOutputBuildContext& ctx, const SubmitPullRequestReviewConfig& cfg);
Job build_dispatch_workflow_job(const SafeOutputBuildContext& ctx, const DispatchWorkflowConfig& cfg);
Job build_assign_to_agent_job(const SafeOutputBuildContext& ctx, const AssignToAgentConfig& cfg);
Job build_create_code_scanning_alert_job(const SafeOutputBuildContext& ctx, const CreateCodeScanningAlertConfig& cfg);

// kind is "missing_tool" or "missing_data"
Job build_missing_report_job(const SafeOutputBuildContext& ctx, const MissingReportConfig& cfg,
                             const std::string& kind);

// Every declared safe-output job, in catalog order. Empty without safe-outputs.
std::vector<Job> build_safe_output_jobs(const SafeOutputBuildContext& ctx);

} // namespace warden::workflow
