#include "workflow/safe_outputs.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <set>
#include <spdlog/spdlog.h>
#include "workflow/entity_operations.hpp"

using json = nlohmann::json;

namespace warden::workflow {

namespace {

constexpr int kDispatchWorkflowMaxCap = 50;

// Normalise a kind's value to a config map. null means "enabled with
// defaults"; false disables the kind. Other types are rejected with a warning.
std::optional<json> kind_map(const json& value, const std::string& config_key) {
    if (value.is_null()) return json::object();
    if (value.is_object()) return value;
    if (value.is_boolean()) {
        if (value.get<bool>()) return json::object();
        spdlog::debug("safe-outputs: {} disabled", config_key);
        return std::nullopt;
    }
    spdlog::warn("safe-outputs: {} must be a map, ignoring", config_key);
    return std::nullopt;
}

std::string string_field(const json& config_map, const char* key) {
    auto it = config_map.find(key);
    if (it != config_map.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return "";
}

bool bool_field(const json& config_map, const char* key, bool fallback) {
    auto it = config_map.find(key);
    if (it != config_map.end() && it->is_boolean()) {
        return it->get<bool>();
    }
    return fallback;
}

bool parse_create_issue(const json& m, SafeOutputsConfig& out, std::string* error) {
    warn_unknown_keys(m, "create-issue",
                      {"max", "github-token", "staged", "target", "target-repo", "allowed-repos",
                       "title-prefix", "labels", "assignees"});
    CreateIssueConfig cfg;
    parse_base_config(m, cfg.base, 1);
    if (!parse_target_config(m, cfg.target, "create-issue", error)) return false;
    cfg.title_prefix = string_field(m, "title-prefix");
    if (m.contains("labels")) cfg.labels = parse_string_list(m["labels"]);
    if (m.contains("assignees")) cfg.assignees = parse_string_list(m["assignees"]);
    out.create_issue = cfg;
    return true;
}

bool parse_create_discussion(const json& m, SafeOutputsConfig& out, std::string* error) {
    warn_unknown_keys(m, "create-discussion",
                      {"max", "github-token", "staged", "target", "target-repo", "allowed-repos",
                       "title-prefix", "category", "labels"});
    CreateDiscussionConfig cfg;
    parse_base_config(m, cfg.base, 1);
    if (!parse_target_config(m, cfg.target, "create-discussion", error)) return false;
    cfg.title_prefix = string_field(m, "title-prefix");
    // Category may be written as a bare id number
    if (m.contains("category")) {
        cfg.category = m["category"].is_string() ? m["category"].get<std::string>() : m["category"].dump();
    }
    if (m.contains("labels")) cfg.labels = parse_string_list(m["labels"]);
    out.create_discussion = cfg;
    return true;
}

bool parse_create_pull_request(const json& m, SafeOutputsConfig& out, std::string* error) {
    warn_unknown_keys(m, "create-pull-request",
                      {"max", "github-token", "staged", "target", "target-repo", "allowed-repos",
                       "title-prefix", "labels", "draft", "base-branch"});
    CreatePullRequestConfig cfg;
    parse_base_config(m, cfg.base, 1);
    if (!parse_target_config(m, cfg.target, "create-pull-request", error)) return false;
    cfg.title_prefix = string_field(m, "title-prefix");
    if (m.contains("labels")) cfg.labels = parse_string_list(m["labels"]);
    cfg.draft = bool_field(m, "draft", true);
    cfg.base_branch = string_field(m, "base-branch");
    out.create_pull_request = cfg;
    return true;
}

bool parse_add_comment(const json& m, SafeOutputsConfig& out, std::string* error) {
    warn_unknown_keys(m, "add-comment",
                      {"max", "github-token", "staged", "target", "target-repo", "allowed-repos", "hide-older-comments"});
    AddCommentConfig cfg;
    parse_base_config(m, cfg.base, 1);
    if (!parse_target_config(m, cfg.target, "add-comment", error)) return false;
    cfg.hide_older_comments = bool_field(m, "hide-older-comments", false);
    out.add_comment = cfg;
    return true;
}

bool parse_submit_review(const json& m, SafeOutputsConfig& out, std::string* error) {
    warn_unknown_keys(m, "submit-pull-request-review",
                      {"max", "github-token", "staged", "target", "target-repo", "allowed-repos", "footer"});
    SubmitPullRequestReviewConfig cfg;
    parse_base_config(m, cfg.base, 1);
    apply_fixed_limit("submit-pull-request-review", cfg.base);
    if (!parse_target_config(m, cfg.target, "submit-pull-request-review", error)) return false;
    cfg.footer = string_field(m, "footer");
    out.submit_pull_request_review = cfg;
    return true;
}

bool parse_dispatch_workflow(const json& value, SafeOutputsConfig& out, std::string* error) {
    DispatchWorkflowConfig cfg;

    // Short form: a bare list of workflow names
    if (value.is_array()) {
        cfg.workflows = parse_string_list(value);
        cfg.base.max = 1;
        out.dispatch_workflow = cfg;
        return true;
    }

    auto m = kind_map(value, "dispatch-workflow");
    if (!m) return true;

    warn_unknown_keys(*m, "dispatch-workflow",
                      {"max", "github-token", "staged", "workflows", "target-repo", "allowed-repos"});
    parse_base_config(*m, cfg.base, 1);
    if (m->contains("workflows")) cfg.workflows = parse_string_list((*m)["workflows"]);

    SafeOutputTargetConfig target;
    if (!parse_target_config(*m, target, "dispatch-workflow", error)) return false;
    cfg.target_repo = target.target_repo;
    cfg.allowed_repos = target.allowed_repos;

    if (cfg.base.max > kDispatchWorkflowMaxCap) {
        spdlog::debug("safe-outputs: dispatch-workflow max {} capped at {}", cfg.base.max, kDispatchWorkflowMaxCap);
        cfg.base.max = kDispatchWorkflowMaxCap;
    }
    out.dispatch_workflow = cfg;
    return true;
}

bool parse_assign_to_agent(const json& m, SafeOutputsConfig& out, std::string* error) {
    warn_unknown_keys(m, "assign-to-agent",
                      {"max", "github-token", "staged", "target", "target-repo", "allowed-repos",
                       "name", "allowed"});
    AssignToAgentConfig cfg;
    parse_base_config(m, cfg.base, 1);

    SafeOutputTargetConfig target;
    if (!parse_target_config(m, target, "assign-to-agent", error)) return false;
    cfg.target = target.target;
    cfg.target_repo = target.target_repo;

    std::string name = string_field(m, "name");
    if (!name.empty()) cfg.default_agent = name;
    if (m.contains("allowed")) cfg.allowed = parse_string_list(m["allowed"]);
    out.assign_to_agent = cfg;
    return true;
}

void parse_code_scanning_alert(const json& m, SafeOutputsConfig& out) {
    warn_unknown_keys(m, "create-code-scanning-alert", {"max", "github-token", "staged", "driver"});
    CreateCodeScanningAlertConfig cfg;
    parse_base_config(m, cfg.base, 0);
    cfg.driver = string_field(m, "driver");
    out.create_code_scanning_alert = cfg;
}

std::optional<MissingReportConfig> parse_missing_report(const json& value, const std::string& config_key,
                                                        const std::string& default_prefix) {
    auto m = kind_map(value, config_key);
    if (!m) return std::nullopt;

    warn_unknown_keys(*m, config_key,
                      {"max", "github-token", "staged", "create-issue", "title-prefix", "labels"});
    MissingReportConfig cfg;
    parse_base_config(*m, cfg.base, 0);
    cfg.create_issue = bool_field(*m, "create-issue", true);
    cfg.title_prefix = string_field(*m, "title-prefix");
    if (cfg.title_prefix.empty()) cfg.title_prefix = default_prefix;
    if (m->contains("labels")) cfg.labels = parse_string_list((*m)["labels"]);
    return cfg;
}

const std::set<std::string>& top_level_keys() {
    static const std::set<std::string> keys = [] {
        std::set<std::string> result = {
            "staged", "github-token",
            "create-issue", "create-discussion", "create-pull-request", "add-comment",
            "submit-pull-request-review", "dispatch-workflow", "assign-to-agent",
            "create-code-scanning-alert", "missing-tool", "missing-data",
        };
        for (const auto& def : entity_operation_definitions()) {
            result.insert(def.config_key);
        }
        return result;
    }();
    return keys;
}

} // anonymous namespace

std::vector<std::string> SafeOutputsConfig::enabled_types() const {
    std::vector<std::string> types;
    if (create_issue) types.push_back("create_issue");
    if (create_discussion) types.push_back("create_discussion");
    if (create_pull_request) types.push_back("create_pull_request");
    if (add_comment) types.push_back("add_comment");
    if (submit_pull_request_review) types.push_back("submit_pull_request_review");
    for (const auto& def : entity_operation_definitions()) {
        if (entity_operations.count(def.config_key)) {
            types.push_back(def.job_name);
        }
    }
    if (create_code_scanning_alert) types.push_back("create_code_scanning_alert");
    if (dispatch_workflow) types.push_back("dispatch_workflow");
    if (assign_to_agent) types.push_back("assign_to_agent");
    if (missing_tool) types.push_back("missing_tool");
    if (missing_data) types.push_back("missing_data");
    return types;
}

SafeOutputsParseResult parse_safe_outputs(const json& value) {
    SafeOutputsParseResult result;
    if (value.is_null()) {
        result.success = true;
        return result;
    }
    if (!value.is_object()) {
        result.error = "safe-outputs must be a map";
        return result;
    }

    try {
        auto& out = result.config;
        for (auto it = value.begin(); it != value.end(); ++it) {
            if (!top_level_keys().count(it.key())) {
                spdlog::warn("safe-outputs: unknown key '{}' ignored", it.key());
            }
        }

        out.staged = bool_field(value, "staged", false);
        out.github_token = string_field(value, "github-token");

        std::string error;
        auto parse_kind = [&](const char* key, auto&& parser) {
            if (!value.contains(key)) return true;
            auto m = kind_map(value[key], key);
            if (!m) return true;
            return parser(*m, out, &error);
        };

        if (!parse_kind("create-issue", parse_create_issue) ||
            !parse_kind("create-discussion", parse_create_discussion) ||
            !parse_kind("create-pull-request", parse_create_pull_request) ||
            !parse_kind("add-comment", parse_add_comment) ||
            !parse_kind("submit-pull-request-review", parse_submit_review) ||
            !parse_kind("assign-to-agent", parse_assign_to_agent)) {
            result.error = error;
            return result;
        }

        if (value.contains("dispatch-workflow") &&
            !parse_dispatch_workflow(value["dispatch-workflow"], out, &error)) {
            result.error = error;
            return result;
        }

        if (value.contains("create-code-scanning-alert")) {
            auto m = kind_map(value["create-code-scanning-alert"], "create-code-scanning-alert");
            if (m) parse_code_scanning_alert(*m, out);
        }

        if (value.contains("missing-tool")) {
            out.missing_tool = parse_missing_report(value["missing-tool"], "missing-tool", "[missing tool]");
        }
        if (value.contains("missing-data")) {
            out.missing_data = parse_missing_report(value["missing-data"], "missing-data", "[missing data]");
        }

        for (const auto& def : entity_operation_definitions()) {
            auto cfg = parse_entity_config(value, def, &error);
            if (cfg) {
                out.entity_operations[def.config_key] = *cfg;
            } else if (!error.empty()) {
                result.error = error;
                return result;
            }
        }
    } catch (const std::exception& e) {
        result.error = std::string("invalid safe-outputs: ") + e.what();
        return result;
    }

    result.success = true;
    return result;
}

bool is_fixed_limit_kind(const std::string& config_key) {
    static const std::set<std::string> kinds = {"submit-pull-request-review"};
    return kinds.count(config_key) > 0;
}

void parse_base_config(const json& config_map, BaseSafeOutputConfig& base, int default_max) {
    base.max = default_max;
    auto it = config_map.find("max");
    if (it != config_map.end()) {
        if (it->is_number_unsigned()) {
            auto value = it->get<uint64_t>();
            if (value > static_cast<uint64_t>(std::numeric_limits<int>::max())) {
                spdlog::warn("safe-outputs: max {} out of range, using {}", value, default_max);
            } else {
                base.max = static_cast<int>(value);
            }
        } else if (it->is_number_integer()) {
            auto value = it->get<int64_t>();
            if (value > std::numeric_limits<int>::max() || value < std::numeric_limits<int>::min()) {
                spdlog::warn("safe-outputs: max {} out of range, using {}", value, default_max);
            } else {
                base.max = static_cast<int>(value);
            }
        } else if (it->is_number()) {
            double value = it->get<double>();
            if (!std::isfinite(value) || value > std::numeric_limits<int>::max() ||
                value < std::numeric_limits<int>::min()) {
                spdlog::warn("safe-outputs: max {} out of range, using {}", value, default_max);
            } else {
                base.max = static_cast<int>(value);
            }
        } else if (it->is_string()) {
            std::string text = it->get<std::string>();
            if (text.rfind("${{", 0) == 0) {
                base.max_expression = text;
            } else {
                try {
                    base.max = std::stoi(text);
                } catch (const std::exception&) {
                    // invalid_argument or out_of_range
                    spdlog::warn("safe-outputs: invalid max '{}', using {}", text, default_max);
                }
            }
        } else if (!it->is_null()) {
            spdlog::warn("safe-outputs: max must be a number or expression, using {}", default_max);
        }
        if (base.max < 0) {
            spdlog::warn("safe-outputs: negative max {}, using {}", base.max, default_max);
            base.max = default_max;
        }
    }
    base.github_token = string_field(config_map, "github-token");
    base.staged = bool_field(config_map, "staged", false);
}

void apply_fixed_limit(const std::string& config_key, BaseSafeOutputConfig& base) {
    if (!is_fixed_limit_kind(config_key)) return;
    if (base.max != 1 || !base.max_expression.empty()) {
        spdlog::debug("safe-outputs: {} is limited to 1 (configured {})", config_key,
                      base.max_expression.empty() ? std::to_string(base.max) : base.max_expression);
    }
    base.max = 1;
    base.max_expression.clear();
}

bool parse_target_config(const json& config_map, SafeOutputTargetConfig& target,
                         const std::string& config_key, std::string* error) {
    auto it = config_map.find("target");
    if (it != config_map.end()) {
        // Explicit entity numbers may be written unquoted
        target.target = it->is_string() ? it->get<std::string>() : it->dump();
    }

    target.target_repo = string_field(config_map, "target-repo");
    if (target.target_repo == "*") {
        if (error) {
            *error = config_key + ": target-repo \"*\" is not allowed; "
                     "name a single repository and list others under allowed-repos";
        }
        return false;
    }

    if (config_map.contains("allowed-repos")) {
        target.allowed_repos = parse_string_list(config_map["allowed-repos"]);
    }
    return true;
}

void warn_unknown_keys(const json& config_map, const std::string& config_key,
                       std::initializer_list<const char*> known) {
    for (auto it = config_map.begin(); it != config_map.end(); ++it) {
        bool found = std::any_of(known.begin(), known.end(),
                                 [&](const char* k) { return it.key() == k; });
        if (!found) {
            spdlog::warn("safe-outputs: unknown key '{}' in {} ignored", it.key(), config_key);
        }
    }
}

std::vector<std::string> parse_string_list(const json& value) {
    std::vector<std::string> result;
    if (value.is_string()) {
        result.push_back(value.get<std::string>());
        return result;
    }
    if (!value.is_array()) return result;
    for (const auto& item : value) {
        if (item.is_string()) {
            result.push_back(item.get<std::string>());
        }
    }
    return result;
}

std::string max_env_value(const BaseSafeOutputConfig& base) {
    if (!base.max_expression.empty()) return base.max_expression;
    return std::to_string(base.max);
}

} // namespace warden::workflow
