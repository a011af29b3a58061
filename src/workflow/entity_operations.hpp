#pragma once
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "workflow/permissions.hpp"
#include "workflow/safe_output_jobs.hpp"
#include "workflow/safe_outputs.hpp"

namespace warden::workflow {

enum class EntityOperation {
    CLOSE,
    UPDATE
};

enum class EntityKind {
    ISSUE,
    PULL_REQUEST,
    DISCUSSION
};

const char* entity_operation_to_string(EntityOperation op);
const char* entity_kind_to_string(EntityKind kind);

// Declarative description of one close/update job kind
struct EntityOperationDefinition {
    EntityOperation operation;
    EntityKind entity;
    const char* config_key;         // "close-issue"
    const char* env_prefix;         // "GH_AW_CLOSE_ISSUE"
    const char* job_name;           // also the output type tag
    const char* step_name;
    const char* step_id;
    const char* script_name;
    const char* output_number_key;
    const char* output_url_key;
    const char* event_number_path;  // direct event
    const char* comment_number_path;  // comment on the entity
    Permissions (*permissions)();
};

// All definitions in job order
const std::vector<EntityOperationDefinition>& entity_operation_definitions();

// nullptr for unknown keys
const EntityOperationDefinition* find_entity_operation(const std::string& config_key);

// nullopt when def.config_key is absent from output_map, or when the config is
// invalid (error is set in that case).
std::optional<EntityOperationConfig> parse_entity_config(const nlohmann::json& output_map,
                                                         const EntityOperationDefinition& def,
                                                         std::string* error);

Job build_entity_job(const SafeOutputBuildContext& ctx, const EntityOperationDefinition& def,
                     const EntityOperationConfig& config);

} // namespace warden::workflow
