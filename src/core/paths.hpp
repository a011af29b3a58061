#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace warden::core::paths {

// Best-effort path to current executable; empty if unavailable.
std::filesystem::path executable_path();

// Best-effort directory of the current executable; empty if unavailable.
std::filesystem::path executable_dir();

// Common search roots for .env and other project-relative files.
std::vector<std::filesystem::path> project_search_paths();

// Walk up from start until a directory containing ".github" is found.
std::optional<std::filesystem::path> find_repository_root(const std::filesystem::path& start);

// Workflow identity from a source or lock file path:
// "x/.github/aw/triage.md" -> "triage", "deploy.lock.yml" -> "deploy", "ci.json" -> "ci".
std::string workflow_id_from_path(const std::filesystem::path& path);

} // namespace warden::core::paths
