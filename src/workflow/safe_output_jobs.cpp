#include "workflow/safe_output_jobs.hpp"
#include <algorithm>
#include <cctype>
#include <spdlog/spdlog.h>
#include "workflow/entity_operations.hpp"
#include "workflow/expressions.hpp"
#include "workflow/steps.hpp"

using json = nlohmann::json;

namespace warden::workflow {

namespace {

constexpr const char* kDefaultToken = "${{ secrets.GH_AW_GITHUB_TOKEN || secrets.GITHUB_TOKEN }}";
constexpr const char* kAgentToken = "${{ secrets.GH_AW_AGENT_TOKEN || secrets.GH_AW_GITHUB_TOKEN || secrets.GITHUB_TOKEN }}";
constexpr const char* kDefaultSecurityDriver = "GitHub Agentic Workflows Security Scanner";
constexpr const char* kSarifDir = "/tmp/gh-aw/sarif/";
constexpr int kSafeOutputTimeoutMinutes = 15;

std::string join_comma(const std::vector<std::string>& items) {
    std::string result;
    for (const auto& item : items) {
        if (!result.empty()) result += ",";
        result += item;
    }
    return result;
}

void set_if(std::map<std::string, std::string>& env, const std::string& key, const std::string& value) {
    if (!value.empty()) {
        env[key] = value;
    }
}

bool is_triggering_target(const std::string& target) {
    return target.empty() || target == "triggering";
}

} // anonymous namespace

std::map<std::string, std::string> safe_output_metadata_env(const WorkflowData& data) {
    std::map<std::string, std::string> env;
    env["GH_AW_WORKFLOW_NAME"] = data.name;
    set_if(env, "GH_AW_WORKFLOW_SOURCE", data.source);
    set_if(env, "GH_AW_TRACKER_ID", data.tracker_id);
    return env;
}

std::string safe_output_token(const SafeOutputsConfig* outputs, const std::string& kind_token) {
    if (!kind_token.empty()) return kind_token;
    if (outputs && !outputs->github_token.empty()) return outputs->github_token;
    return kDefaultToken;
}

void add_target_repo_env(std::map<std::string, std::string>& env, const std::string& target_repo,
                         const std::vector<std::string>& allowed_repos) {
    set_if(env, "GH_AW_TARGET_REPO_SLUG", target_repo);
    if (!allowed_repos.empty()) {
        env["GH_AW_ALLOWED_REPOS"] = join_comma(allowed_repos);
    }
}

Job build_safe_output_job(const SafeOutputBuildContext& ctx, const SafeOutputJobConfig& cfg) {
    const SafeOutputsConfig* outputs = ctx.data.safe_outputs ? &*ctx.data.safe_outputs : nullptr;

    Job job;
    job.name = cfg.job_name;
    job.needs.push_back(ctx.main_job_name);
    for (const auto& need : cfg.needs) {
        if (std::find(job.needs.begin(), job.needs.end(), need) == job.needs.end()) {
            job.needs.push_back(need);
        }
    }
    job.condition = expr_and({safe_output_type_condition(ctx.main_job_name, cfg.output_type), cfg.condition});
    job.timeout_minutes = kSafeOutputTimeoutMinutes;

    // Dev mode checks out the local actions folder
    job.permissions = cfg.permissions;
    if (ctx.config.action_mode == ActionMode::DEV) {
        job.permissions = Permissions::merge(job.permissions, contents_read_permissions());
    }

    job.env = safe_output_metadata_env(ctx.data);
    job.env["GH_AW_AGENT_OUTPUT"] = std::string(kAgentOutputDir) + kAgentOutputArtifact;
    for (const auto& [key, value] : cfg.env) {
        job.env[key] = value;
    }
    bool staged = cfg.staged || (outputs && outputs->staged);
    if (staged && cfg.target_repo.empty()) {
        job.env["GH_AW_SAFE_OUTPUTS_STAGED"] = "true";
    }

    job.steps.push_back(download_agent_output_step());
    for (auto& step : setup_steps(ctx.config)) {
        job.steps.push_back(std::move(step));
    }
    job.steps.insert(job.steps.end(), cfg.pre_steps.begin(), cfg.pre_steps.end());
    job.steps.push_back(github_script_step(cfg.step_name, cfg.step_id, cfg.script_name,
                                           safe_output_token(outputs, cfg.token)));
    job.steps.insert(job.steps.end(), cfg.post_steps.begin(), cfg.post_steps.end());

    job.outputs = cfg.outputs;
    return job;
}

Job build_create_issue_job(const SafeOutputBuildContext& ctx, const CreateIssueConfig& cfg) {
    SafeOutputJobConfig job_cfg;
    job_cfg.job_name = "create_issue";
    job_cfg.step_name = "Create Output Issue";
    job_cfg.step_id = "create_issue";
    job_cfg.script_name = "create_issue";
    job_cfg.output_type = "create_issue";
    job_cfg.permissions = contents_read_issues_write_permissions();
    job_cfg.token = cfg.base.github_token;
    job_cfg.staged = cfg.base.staged;
    job_cfg.target_repo = cfg.target.target_repo;

    job_cfg.env["GH_AW_CREATE_ISSUE_MAX"] = max_env_value(cfg.base);
    set_if(job_cfg.env, "GH_AW_ISSUE_TITLE_PREFIX", cfg.title_prefix);
    set_if(job_cfg.env, "GH_AW_ISSUE_LABELS", join_comma(cfg.labels));
    set_if(job_cfg.env, "GH_AW_ISSUE_ASSIGNEES", join_comma(cfg.assignees));
    add_target_repo_env(job_cfg.env, cfg.target.target_repo, cfg.target.allowed_repos);

    job_cfg.outputs["issue_number"] = wrap_expression(step_output("create_issue", "issue_number"));
    job_cfg.outputs["issue_url"] = wrap_expression(step_output("create_issue", "issue_url"));
    return build_safe_output_job(ctx, job_cfg);
}

Job build_create_discussion_job(const SafeOutputBuildContext& ctx, const CreateDiscussionConfig& cfg) {
    SafeOutputJobConfig job_cfg;
    job_cfg.job_name = "create_discussion";
    job_cfg.step_name = "Create Output Discussion";
    job_cfg.step_id = "create_discussion";
    job_cfg.script_name = "create_discussion";
    job_cfg.output_type = "create_discussion";
    job_cfg.permissions = contents_read_discussions_write_permissions();
    job_cfg.token = cfg.base.github_token;
    job_cfg.staged = cfg.base.staged;
    job_cfg.target_repo = cfg.target.target_repo;

    job_cfg.env["GH_AW_CREATE_DISCUSSION_MAX"] = max_env_value(cfg.base);
    set_if(job_cfg.env, "GH_AW_DISCUSSION_TITLE_PREFIX", cfg.title_prefix);
    set_if(job_cfg.env, "GH_AW_DISCUSSION_CATEGORY", cfg.category);
    set_if(job_cfg.env, "GH_AW_DISCUSSION_LABELS", join_comma(cfg.labels));
    add_target_repo_env(job_cfg.env, cfg.target.target_repo, cfg.target.allowed_repos);

    job_cfg.outputs["discussion_number"] = wrap_expression(step_output("create_discussion", "discussion_number"));
    job_cfg.outputs["discussion_url"] = wrap_expression(step_output("create_discussion", "discussion_url"));
    return build_safe_output_job(ctx, job_cfg);
}

Job build_create_pull_request_job(const SafeOutputBuildContext& ctx, const CreatePullRequestConfig& cfg) {
    SafeOutputJobConfig job_cfg;
    job_cfg.job_name = "create_pull_request";
    job_cfg.step_name = "Create Pull Request";
    job_cfg.step_id = "create_pull_request";
    job_cfg.script_name = "create_pull_request";
    job_cfg.output_type = "create_pull_request";
    job_cfg.permissions = contents_write_pull_requests_write_permissions();
    job_cfg.token = cfg.base.github_token;
    job_cfg.staged = cfg.base.staged;
    job_cfg.target_repo = cfg.target.target_repo;

    // The patch produced by the agent is applied onto a full checkout
    job_cfg.pre_steps.push_back({
        {"name", "Download patch artifact"},
        {"continue-on-error", true},
        {"uses", kDownloadArtifactAction},
        {"with", {{"name", "aw.patch"}, {"path", "/tmp/gh-aw/"}}},
    });
    job_cfg.pre_steps.push_back({
        {"name", "Checkout repository"},
        {"uses", kCheckoutAction},
        {"with", {{"fetch-depth", 0}, {"persist-credentials", false}}},
    });
    job_cfg.pre_steps.push_back({
        {"name", "Configure Git credentials"},
        {"run", "git config --global user.email \"github-actions[bot]@users.noreply.github.com\"\n"
                "git config --global user.name \"github-actions[bot]\""},
    });

    job_cfg.env["GH_AW_CREATE_PULL_REQUEST_MAX"] = max_env_value(cfg.base);
    job_cfg.env["GH_AW_WORKFLOW_ID"] = ctx.data.workflow_id;
    job_cfg.env["GH_AW_BASE_BRANCH"] = cfg.base_branch.empty() ? "${{ github.ref_name }}" : cfg.base_branch;
    job_cfg.env["GH_AW_PR_DRAFT"] = cfg.draft ? "true" : "false";
    set_if(job_cfg.env, "GH_AW_PR_TITLE_PREFIX", cfg.title_prefix);
    set_if(job_cfg.env, "GH_AW_PR_LABELS", join_comma(cfg.labels));
    add_target_repo_env(job_cfg.env, cfg.target.target_repo, cfg.target.allowed_repos);

    job_cfg.outputs["pull_request_number"] = wrap_expression(step_output("create_pull_request", "pull_request_number"));
    job_cfg.outputs["pull_request_url"] = wrap_expression(step_output("create_pull_request", "pull_request_url"));
    job_cfg.outputs["branch_name"] = wrap_expression(step_output("create_pull_request", "branch_name"));
    return build_safe_output_job(ctx, job_cfg);
}

Job build_add_comment_job(const SafeOutputBuildContext& ctx, const AddCommentConfig& cfg,
                          const std::vector<std::string>& created_jobs) {
    SafeOutputJobConfig job_cfg;
    job_cfg.job_name = "add_comment";
    job_cfg.step_name = "Add Issue Comment";
    job_cfg.step_id = "add_comment";
    job_cfg.script_name = "add_comment";
    job_cfg.output_type = "add_comment";
    job_cfg.permissions = PermissionsBuilder()
        .with_contents(PermissionLevel::READ)
        .with_discussions(PermissionLevel::WRITE)
        .with_issues(PermissionLevel::WRITE)
        .with_pull_requests(PermissionLevel::WRITE)
        .build();
    job_cfg.token = cfg.base.github_token;
    job_cfg.staged = cfg.base.staged;
    job_cfg.target_repo = cfg.target.target_repo;

    job_cfg.env["GH_AW_ADD_COMMENT_MAX"] = max_env_value(cfg.base);
    set_if(job_cfg.env, "GH_AW_COMMENT_TARGET", cfg.target.target);
    if (cfg.hide_older_comments) {
        job_cfg.env["GH_AW_HIDE_OLDER_COMMENTS"] = "true";
    }
    add_target_repo_env(job_cfg.env, cfg.target.target_repo, cfg.target.allowed_repos);

    // Link back to entities created in the same run
    for (const auto& created : created_jobs) {
        std::string entity;
        if (created == "create_issue") entity = "issue";
        else if (created == "create_discussion") entity = "discussion";
        else if (created == "create_pull_request") entity = "pull_request";
        else continue;

        std::string upper = entity;
        std::transform(upper.begin(), upper.end(), upper.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        job_cfg.needs.push_back(created);
        job_cfg.env["GH_AW_CREATED_" + upper + "_URL"] = wrap_expression(needs_output(created, entity + "_url"));
        job_cfg.env["GH_AW_CREATED_" + upper + "_NUMBER"] = wrap_expression(needs_output(created, entity + "_number"));
    }

    if (is_triggering_target(cfg.target.target)) {
        job_cfg.condition = expr_or({
            "github.event.issue.number",
            "github.event.pull_request.number",
            "github.event.discussion.number",
        });
    }

    job_cfg.outputs["comment_id"] = wrap_expression(step_output("add_comment", "comment_id"));
    job_cfg.outputs["comment_url"] = wrap_expression(step_output("add_comment", "comment_url"));
    return build_safe_output_job(ctx, job_cfg);
}

Job build_submit_pull_request_review_job(const SafeOutputBuildContext& ctx, const SubmitPullRequestReviewConfig& cfg) {
    SafeOutputJobConfig job_cfg;
    job_cfg.job_name = "submit_pull_request_review";
    job_cfg.step_name = "Submit Pull Request Review";
    job_cfg.step_id = "submit_pull_request_review";
    job_cfg.script_name = "submit_pr_review";
    job_cfg.output_type = "submit_pull_request_review";
    job_cfg.permissions = contents_read_pull_requests_write_permissions();
    job_cfg.token = cfg.base.github_token;
    job_cfg.staged = cfg.base.staged;
    job_cfg.target_repo = cfg.target.target_repo;

    job_cfg.env["GH_AW_SUBMIT_PULL_REQUEST_REVIEW_MAX"] = max_env_value(cfg.base);
    set_if(job_cfg.env, "GH_AW_REVIEW_TARGET", cfg.target.target);
    set_if(job_cfg.env, "GH_AW_REVIEW_FOOTER", cfg.footer);
    add_target_repo_env(job_cfg.env, cfg.target.target_repo, cfg.target.allowed_repos);

    if (is_triggering_target(cfg.target.target)) {
        job_cfg.condition = "github.event.pull_request.number";
    }

    job_cfg.outputs["review_id"] = wrap_expression(step_output("submit_pull_request_review", "review_id"));
    job_cfg.outputs["review_url"] = wrap_expression(step_output("submit_pull_request_review", "review_url"));
    return build_safe_output_job(ctx, job_cfg);
}

Job build_dispatch_workflow_job(const SafeOutputBuildContext& ctx, const DispatchWorkflowConfig& cfg) {
    SafeOutputJobConfig job_cfg;
    job_cfg.job_name = "dispatch_workflow";
    job_cfg.step_name = "Dispatch Workflows";
    job_cfg.step_id = "dispatch_workflow";
    job_cfg.script_name = "dispatch_workflow";
    job_cfg.output_type = "dispatch_workflow";
    job_cfg.permissions = actions_write_permissions();
    job_cfg.token = cfg.base.github_token;
    job_cfg.staged = cfg.base.staged;
    job_cfg.target_repo = cfg.target_repo;

    job_cfg.env["GH_AW_DISPATCH_WORKFLOW_MAX"] = max_env_value(cfg.base);
    job_cfg.env["GH_AW_DISPATCH_WORKFLOWS"] = json(cfg.workflows).dump();
    json files = json::object();
    for (const auto& [name, extension] : cfg.workflow_files) {
        files[name] = extension;
    }
    job_cfg.env["GH_AW_DISPATCH_WORKFLOW_FILES"] = files.dump();
    add_target_repo_env(job_cfg.env, cfg.target_repo, cfg.allowed_repos);

    job_cfg.outputs["dispatched_workflows"] = wrap_expression(step_output("dispatch_workflow", "dispatched_workflows"));
    return build_safe_output_job(ctx, job_cfg);
}

Job build_assign_to_agent_job(const SafeOutputBuildContext& ctx, const AssignToAgentConfig& cfg) {
    SafeOutputJobConfig job_cfg;
    job_cfg.job_name = "assign_to_agent";
    job_cfg.step_name = "Assign To Agent";
    job_cfg.step_id = "assign_to_agent";
    job_cfg.script_name = "assign_to_agent";
    job_cfg.output_type = "assign_to_agent";
    job_cfg.permissions = contents_read_issues_pull_requests_write_permissions();
    // Agent assignment needs a user token; the default GITHUB_TOKEN cannot assign bots
    job_cfg.token = cfg.base.github_token.empty() ? kAgentToken : cfg.base.github_token;
    job_cfg.staged = cfg.base.staged;
    job_cfg.target_repo = cfg.target_repo;

    job_cfg.env["GH_AW_AGENT_MAX"] = max_env_value(cfg.base);
    job_cfg.env["GH_AW_AGENT_DEFAULT"] = cfg.default_agent;
    set_if(job_cfg.env, "GH_AW_AGENT_TARGET", cfg.target);
    set_if(job_cfg.env, "GH_AW_AGENT_ALLOWED", join_comma(cfg.allowed));
    add_target_repo_env(job_cfg.env, cfg.target_repo, {});

    // Issues created in the same run with the agent as assignee are handed over here
    const auto& outputs = ctx.data.safe_outputs;
    if (outputs && outputs->create_issue) {
        const auto& assignees = outputs->create_issue->assignees;
        if (std::find(assignees.begin(), assignees.end(), cfg.default_agent) != assignees.end()) {
            job_cfg.needs.push_back("create_issue");
            job_cfg.env["GH_AW_ISSUES_TO_ASSIGN"] = wrap_expression(needs_output("create_issue", "issue_number"));
        }
    }

    job_cfg.outputs["assigned_agents"] = wrap_expression(step_output("assign_to_agent", "assigned_agents"));
    return build_safe_output_job(ctx, job_cfg);
}

Job build_create_code_scanning_alert_job(const SafeOutputBuildContext& ctx, const CreateCodeScanningAlertConfig& cfg) {
    const std::string step_id = "create_code_scanning_alert";

    SafeOutputJobConfig job_cfg;
    job_cfg.job_name = "create_code_scanning_alert";
    job_cfg.step_name = "Create Code Scanning Alert";
    job_cfg.step_id = step_id;
    job_cfg.script_name = "create_code_scanning_alert";
    job_cfg.output_type = "create_code_scanning_alert";
    job_cfg.permissions = contents_read_security_events_write_actions_read_permissions();
    job_cfg.token = cfg.base.github_token;
    job_cfg.staged = cfg.base.staged;

    job_cfg.env["GH_AW_SECURITY_REPORT_MAX"] = max_env_value(cfg.base);
    job_cfg.env["GH_AW_SECURITY_REPORT_DRIVER"] = cfg.driver.empty() ? kDefaultSecurityDriver : cfg.driver;
    job_cfg.env["GH_AW_WORKFLOW_FILENAME"] = ctx.data.workflow_id;

    const std::string sarif_condition = step_output(step_id, "sarif_file") + " != ''";
    json upload = upload_artifact_step("Upload SARIF artifact", "code-scanning-alert.sarif", kSarifDir);
    upload["if"] = sarif_condition;
    job_cfg.post_steps.push_back(upload);
    job_cfg.post_steps.push_back({
        {"name", "Upload SARIF to GitHub Security"},
        {"if", sarif_condition},
        {"uses", "github/codeql-action/upload-sarif@v3"},
        {"with", {{"sarif_file", wrap_expression(step_output(step_id, "sarif_file"))}, {"wait-for-processing", true}}},
    });

    for (const char* key : {"sarif_file", "findings_count", "artifact_uploaded", "codeql_uploaded"}) {
        job_cfg.outputs[key] = wrap_expression(step_output(step_id, key));
    }
    return build_safe_output_job(ctx, job_cfg);
}

Job build_missing_report_job(const SafeOutputBuildContext& ctx, const MissingReportConfig& cfg,
                             const std::string& kind) {
    const bool is_tool = kind == "missing_tool";
    const std::string prefix = is_tool ? "GH_AW_MISSING_TOOL" : "GH_AW_MISSING_DATA";

    SafeOutputJobConfig job_cfg;
    job_cfg.job_name = kind;
    job_cfg.step_name = is_tool ? "Record Missing Tool" : "Record Missing Data";
    job_cfg.step_id = kind;
    job_cfg.script_name = kind;
    job_cfg.output_type = kind;
    job_cfg.permissions = cfg.create_issue ? contents_read_issues_write_permissions() : contents_read_permissions();
    job_cfg.token = cfg.base.github_token;
    job_cfg.staged = cfg.base.staged;

    job_cfg.env[prefix + "_MAX"] = max_env_value(cfg.base);
    job_cfg.env[prefix + "_CREATE_ISSUE"] = cfg.create_issue ? "true" : "false";
    set_if(job_cfg.env, prefix + "_TITLE_PREFIX", cfg.title_prefix);
    set_if(job_cfg.env, prefix + "_LABELS", join_comma(cfg.labels));

    const std::string reported = is_tool ? "tools_reported" : "data_reported";
    job_cfg.outputs[reported] = wrap_expression(step_output(kind, reported));
    job_cfg.outputs["total_count"] = wrap_expression(step_output(kind, "total_count"));
    return build_safe_output_job(ctx, job_cfg);
}

std::vector<Job> build_safe_output_jobs(const SafeOutputBuildContext& ctx) {
    std::vector<Job> jobs;
    if (!ctx.data.safe_outputs) {
        return jobs;
    }
    const auto& outputs = *ctx.data.safe_outputs;

    std::vector<std::string> created_jobs;
    if (outputs.create_issue) {
        jobs.push_back(build_create_issue_job(ctx, *outputs.create_issue));
        created_jobs.push_back("create_issue");
    }
    if (outputs.create_discussion) {
        jobs.push_back(build_create_discussion_job(ctx, *outputs.create_discussion));
        created_jobs.push_back("create_discussion");
    }
    if (outputs.create_pull_request) {
        jobs.push_back(build_create_pull_request_job(ctx, *outputs.create_pull_request));
        created_jobs.push_back("create_pull_request");
    }
    if (outputs.add_comment) {
        jobs.push_back(build_add_comment_job(ctx, *outputs.add_comment, created_jobs));
    }
    if (outputs.submit_pull_request_review) {
        jobs.push_back(build_submit_pull_request_review_job(ctx, *outputs.submit_pull_request_review));
    }
    for (const auto& def : entity_operation_definitions()) {
        auto it = outputs.entity_operations.find(def.config_key);
        if (it != outputs.entity_operations.end()) {
            jobs.push_back(build_entity_job(ctx, def, it->second));
        }
    }
    if (outputs.create_code_scanning_alert) {
        jobs.push_back(build_create_code_scanning_alert_job(ctx, *outputs.create_code_scanning_alert));
    }
    if (outputs.dispatch_workflow) {
        jobs.push_back(build_dispatch_workflow_job(ctx, *outputs.dispatch_workflow));
    }
    if (outputs.assign_to_agent) {
        jobs.push_back(build_assign_to_agent_job(ctx, *outputs.assign_to_agent));
    }
    if (outputs.missing_tool) {
        jobs.push_back(build_missing_report_job(ctx, *outputs.missing_tool, "missing_tool"));
    }
    if (outputs.missing_data) {
        jobs.push_back(build_missing_report_job(ctx, *outputs.missing_data, "missing_data"));
    }

    spdlog::debug("Built {} safe-output jobs", jobs.size());
    return jobs;
}

} // namespace warden::workflow
