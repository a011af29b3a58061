#pragma once
#include <string>
#include <vector>

namespace warden::workflow {

// Join non-empty conditions with " && ", parenthesising compound terms.
std::string expr_and(const std::vector<std::string>& terms);

// Join non-empty conditions with " || ", parenthesising compound terms.
std::string expr_or(const std::vector<std::string>& terms);

// "${{ expr }}"
std::string wrap_expression(const std::string& expr);

// Strip a surrounding "${{ }}" if present.
std::string unwrap_expression(const std::string& expr);

// Gate for a safe-output job: the main job ran and emitted an item of output_type.
std::string safe_output_type_condition(const std::string& main_job, const std::string& output_type);

// "needs.<job>.outputs.<key>"
std::string needs_output(const std::string& job, const std::string& key);

// "steps.<id>.outputs.<key>"
std::string step_output(const std::string& step_id, const std::string& key);

} // namespace warden::workflow
