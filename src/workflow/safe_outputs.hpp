#pragma once
#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace warden::workflow {

// Fields every safe-output kind accepts
struct BaseSafeOutputConfig {
    int max = 0;                 // 0 = unlimited
    std::string max_expression;  // "${{ ... }}" supplied instead of a number
    std::string github_token;
    bool staged = false;
};

struct SafeOutputTargetConfig {
    std::string target;          // "triggering" (default), "*", or an explicit number
    std::string target_repo;     // "owner/repo"; "*" is rejected
    std::vector<std::string> allowed_repos;
};

struct SafeOutputFilterConfig {
    std::vector<std::string> required_labels;
    std::string required_title_prefix;
};

// Discussion-only; no effect while empty
struct SafeOutputDiscussionFilterConfig {
    std::string required_category;
};

// Update operations only; no effect while empty
struct UpdateEntityFields {
    std::optional<bool> title;
    std::optional<bool> body;
    std::optional<bool> labels;
    std::optional<bool> status;
    std::vector<std::string> allowed_labels;
};

// Configuration shared by every close/update entity operation
struct EntityOperationConfig {
    BaseSafeOutputConfig base;
    SafeOutputTargetConfig target;
    SafeOutputFilterConfig filter;
    SafeOutputDiscussionFilterConfig discussion_filter;
    UpdateEntityFields update;
};

struct CreateIssueConfig {
    BaseSafeOutputConfig base;
    SafeOutputTargetConfig target;
    std::string title_prefix;
    std::vector<std::string> labels;
    std::vector<std::string> assignees;
};

struct CreateDiscussionConfig {
    BaseSafeOutputConfig base;
    SafeOutputTargetConfig target;
    std::string title_prefix;
    std::string category;
    std::vector<std::string> labels;
};

struct CreatePullRequestConfig {
    BaseSafeOutputConfig base;
    SafeOutputTargetConfig target;
    std::string title_prefix;
    std::vector<std::string> labels;
    bool draft = true;
    std::string base_branch;
};

struct AddCommentConfig {
    BaseSafeOutputConfig base;
    SafeOutputTargetConfig target;
    bool hide_older_comments = false;
};

struct SubmitPullRequestReviewConfig {
    BaseSafeOutputConfig base;
    SafeOutputTargetConfig target;
    std::string footer;
};

struct DispatchWorkflowConfig {
    BaseSafeOutputConfig base;
    std::vector<std::string> workflows;
    std::map<std::string, std::string> workflow_files;  // name -> ".lock.yml" / ".yml", filled at validation
    std::string target_repo;
    std::vector<std::string> allowed_repos;
};

struct AssignToAgentConfig {
    BaseSafeOutputConfig base;
    std::string default_agent = "copilot";
    std::string target;
    std::string target_repo;
    std::vector<std::string> allowed;
};

struct CreateCodeScanningAlertConfig {
    BaseSafeOutputConfig base;
    std::string driver;
};

// missing-tool and missing-data share this shape
struct MissingReportConfig {
    BaseSafeOutputConfig base;
    bool create_issue = true;
    std::string title_prefix;
    std::vector<std::string> labels;
};

// One optional slot per declarable kind
struct SafeOutputsConfig {
    std::optional<CreateIssueConfig> create_issue;
    std::optional<CreateDiscussionConfig> create_discussion;
    std::optional<CreatePullRequestConfig> create_pull_request;
    std::optional<AddCommentConfig> add_comment;
    std::optional<SubmitPullRequestReviewConfig> submit_pull_request_review;
    std::map<std::string, EntityOperationConfig> entity_operations;  // by config key
    std::optional<DispatchWorkflowConfig> dispatch_workflow;
    std::optional<AssignToAgentConfig> assign_to_agent;
    std::optional<CreateCodeScanningAlertConfig> create_code_scanning_alert;
    std::optional<MissingReportConfig> missing_tool;
    std::optional<MissingReportConfig> missing_data;

    bool staged = false;
    std::string github_token;

    // Output type tags ("create_issue", "close_discussion", ...) in job order
    std::vector<std::string> enabled_types() const;
};

struct SafeOutputsParseResult {
    bool success = false;
    std::string error;
    SafeOutputsConfig config;
};

// Parse the "safe-outputs" frontmatter map.
SafeOutputsParseResult parse_safe_outputs(const nlohmann::json& value);

// Kinds whose effective max is always 1
bool is_fixed_limit_kind(const std::string& config_key);

// Fill base fields from a kind's config map. default_max applies when "max" is absent.
void parse_base_config(const nlohmann::json& config_map, BaseSafeOutputConfig& base, int default_max);

// Clamp fixed-limit kinds to 1; silent apart from a debug log.
void apply_fixed_limit(const std::string& config_key, BaseSafeOutputConfig& base);

// Target fields. Returns false (with error set) for the "*" target-repo wildcard.
bool parse_target_config(const nlohmann::json& config_map, SafeOutputTargetConfig& target,
                         const std::string& config_key, std::string* error);

// Warn about keys a kind does not understand; they are otherwise ignored.
void warn_unknown_keys(const nlohmann::json& config_map, const std::string& config_key,
                       std::initializer_list<const char*> known);

// String list from an array value; non-string items are skipped. A single string becomes a one-item list.
std::vector<std::string> parse_string_list(const nlohmann::json& value);

// Env value for a max: the expression when present, otherwise the number.
std::string max_env_value(const BaseSafeOutputConfig& base);

} // namespace warden::workflow
