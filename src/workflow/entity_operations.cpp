#include "workflow/entity_operations.hpp"
#include <spdlog/spdlog.h>
#include "workflow/expressions.hpp"

using json = nlohmann::json;

namespace warden::workflow {

namespace {

std::string join_comma(const std::vector<std::string>& items) {
    std::string result;
    for (const auto& item : items) {
        if (!result.empty()) result += ",";
        result += item;
    }
    return result;
}

// Update flags are enabled by presence of the key; an explicit false disables.
std::optional<bool> update_flag(const json& config_map, const char* key) {
    auto it = config_map.find(key);
    if (it == config_map.end()) return std::nullopt;
    if (it->is_boolean()) return it->get<bool>();
    return true;
}

} // anonymous namespace

const char* entity_operation_to_string(EntityOperation op) {
    switch (op) {
        case EntityOperation::CLOSE:  return "close";
        case EntityOperation::UPDATE: return "update";
        default: return "unknown";
    }
}

const char* entity_kind_to_string(EntityKind kind) {
    switch (kind) {
        case EntityKind::ISSUE:        return "issue";
        case EntityKind::PULL_REQUEST: return "pull_request";
        case EntityKind::DISCUSSION:   return "discussion";
        default: return "unknown";
    }
}

const std::vector<EntityOperationDefinition>& entity_operation_definitions() {
    static const std::vector<EntityOperationDefinition> definitions = {
        {EntityOperation::CLOSE, EntityKind::ISSUE,
         "close-issue", "GH_AW_CLOSE_ISSUE", "close_issue",
         "Close Issue", "close_issue", "close_issue",
         "issue_number", "issue_url",
         "github.event.issue.number", "github.event.comment.issue.number",
         contents_read_issues_write_permissions},
        {EntityOperation::CLOSE, EntityKind::PULL_REQUEST,
         "close-pull-request", "GH_AW_CLOSE_PR", "close_pull_request",
         "Close Pull Request", "close_pull_request", "close_pull_request",
         "pull_request_number", "pull_request_url",
         "github.event.pull_request.number", "github.event.comment.pull_request.number",
         contents_read_pull_requests_write_permissions},
        {EntityOperation::CLOSE, EntityKind::DISCUSSION,
         "close-discussion", "GH_AW_CLOSE_DISCUSSION", "close_discussion",
         "Close Discussion", "close_discussion", "close_discussion",
         "discussion_number", "discussion_url",
         "github.event.discussion.number", "github.event.comment.discussion.number",
         contents_read_discussions_write_permissions},
        {EntityOperation::UPDATE, EntityKind::ISSUE,
         "update-issue", "GH_AW_UPDATE_ISSUE", "update_issue",
         "Update Issue", "update_issue", "update_issue",
         "issue_number", "issue_url",
         "github.event.issue.number", "github.event.comment.issue.number",
         contents_read_issues_write_permissions},
        {EntityOperation::UPDATE, EntityKind::PULL_REQUEST,
         "update-pull-request", "GH_AW_UPDATE_PR", "update_pull_request",
         "Update Pull Request", "update_pull_request", "update_pull_request",
         "pull_request_number", "pull_request_url",
         "github.event.pull_request.number", "github.event.comment.pull_request.number",
         contents_read_pull_requests_write_permissions},
        {EntityOperation::UPDATE, EntityKind::DISCUSSION,
         "update-discussion", "GH_AW_UPDATE_DISCUSSION", "update_discussion",
         "Update Discussion", "update_discussion", "update_discussion",
         "discussion_number", "discussion_url",
         "github.event.discussion.number", "github.event.comment.discussion.number",
         contents_read_discussions_write_permissions},
    };
    return definitions;
}

const EntityOperationDefinition* find_entity_operation(const std::string& config_key) {
    for (const auto& def : entity_operation_definitions()) {
        if (config_key == def.config_key) {
            return &def;
        }
    }
    return nullptr;
}

std::optional<EntityOperationConfig> parse_entity_config(const json& output_map,
                                                         const EntityOperationDefinition& def,
                                                         std::string* error) {
    if (!output_map.is_object() || !output_map.contains(def.config_key)) {
        return std::nullopt;
    }

    const json& value = output_map[def.config_key];
    json config_map = json::object();
    if (value.is_object()) {
        config_map = value;
    } else if (value.is_boolean() && !value.get<bool>()) {
        return std::nullopt;
    } else if (!value.is_null() && !value.is_boolean()) {
        spdlog::warn("safe-outputs: {} must be a map, using defaults", def.config_key);
    }

    if (def.operation == EntityOperation::UPDATE) {
        warn_unknown_keys(config_map, def.config_key,
                          {"max", "github-token", "staged", "target", "target-repo", "allowed-repos",
                           "required-labels", "required-title-prefix", "required-category",
                           "title", "body", "labels", "status", "allowed-labels"});
    } else {
        warn_unknown_keys(config_map, def.config_key,
                          {"max", "github-token", "staged", "target", "target-repo", "allowed-repos",
                           "required-labels", "required-title-prefix", "required-category"});
    }

    EntityOperationConfig config;
    parse_base_config(config_map, config.base, 1);
    apply_fixed_limit(def.config_key, config.base);

    if (!parse_target_config(config_map, config.target, def.config_key, error)) {
        spdlog::debug("safe-outputs: {} rejected", def.config_key);
        return std::nullopt;
    }

    if (config_map.contains("required-labels")) {
        config.filter.required_labels = parse_string_list(config_map["required-labels"]);
    }
    if (config_map.contains("required-title-prefix") && config_map["required-title-prefix"].is_string()) {
        config.filter.required_title_prefix = config_map["required-title-prefix"].get<std::string>();
    }
    if (config_map.contains("required-category") && config_map["required-category"].is_string()) {
        config.discussion_filter.required_category = config_map["required-category"].get<std::string>();
    }

    if (def.operation == EntityOperation::UPDATE) {
        config.update.title = update_flag(config_map, "title");
        config.update.body = update_flag(config_map, "body");
        config.update.labels = update_flag(config_map, "labels");
        config.update.status = update_flag(config_map, "status");
        if (config_map.contains("allowed-labels")) {
            config.update.allowed_labels = parse_string_list(config_map["allowed-labels"]);
            if (!config.update.allowed_labels.empty() && !config.update.labels.has_value()) {
                config.update.labels = true;
            }
        }
    }

    return config;
}

Job build_entity_job(const SafeOutputBuildContext& ctx, const EntityOperationDefinition& def,
                     const EntityOperationConfig& config) {
    const std::string prefix = def.env_prefix;

    SafeOutputJobConfig job_cfg;
    job_cfg.job_name = def.job_name;
    job_cfg.step_name = def.step_name;
    job_cfg.step_id = def.step_id;
    job_cfg.script_name = def.script_name;
    job_cfg.output_type = def.job_name;
    job_cfg.permissions = def.permissions();
    job_cfg.target_repo = config.target.target_repo;

    auto& env = job_cfg.env;
    env[prefix + "_MAX"] = max_env_value(config.base);
    if (!config.target.target.empty()) {
        env[prefix + "_TARGET"] = config.target.target;
    }
    if (!config.filter.required_labels.empty()) {
        env[prefix + "_REQUIRED_LABELS"] = join_comma(config.filter.required_labels);
    }
    if (!config.filter.required_title_prefix.empty()) {
        env[prefix + "_REQUIRED_TITLE_PREFIX"] = config.filter.required_title_prefix;
    }
    if (!config.discussion_filter.required_category.empty()) {
        env[prefix + "_REQUIRED_CATEGORY"] = config.discussion_filter.required_category;
    }

    const auto& update = config.update;
    if (update.title.value_or(false)) env[prefix + "_ALLOW_TITLE"] = "true";
    if (update.body.value_or(false)) env[prefix + "_ALLOW_BODY"] = "true";
    if (update.labels.value_or(false)) env[prefix + "_ALLOW_LABELS"] = "true";
    if (update.status.value_or(false)) env[prefix + "_ALLOW_STATUS"] = "true";
    if (!update.allowed_labels.empty()) {
        env[prefix + "_ALLOWED_LABELS"] = join_comma(update.allowed_labels);
    }

    add_target_repo_env(env, config.target.target_repo, config.target.allowed_repos);

    // Without an explicit target the triggering event must carry the entity
    if (config.target.target.empty() || config.target.target == "triggering") {
        job_cfg.condition = expr_or({def.event_number_path, def.comment_number_path});
    }

    job_cfg.outputs[def.output_number_key] = wrap_expression(step_output(def.step_id, def.output_number_key));
    job_cfg.outputs[def.output_url_key] = wrap_expression(step_output(def.step_id, def.output_url_key));

    job_cfg.token = config.base.github_token;
    job_cfg.staged = config.base.staged;

    spdlog::debug("Building {} job ({} {})", def.job_name,
                  entity_operation_to_string(def.operation), entity_kind_to_string(def.entity));
    return build_safe_output_job(ctx, job_cfg);
}

} // namespace warden::workflow
