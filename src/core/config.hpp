#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace warden::core::config {

// Parse one KEY=VALUE line of a .env file. Comments, blank lines and lines
// without '=' yield nullopt. Surrounding quotes are stripped from the value.
std::optional<std::pair<std::string, std::string>> parse_dotenv_line(const std::string& line);

// Apply a .env file without overriding variables already set. Returns the
// number of variables set, or nullopt if the file could not be opened.
std::optional<size_t> apply_dotenv_file(const std::filesystem::path& env_path);

// Load environment variables from the first .env found on the search paths (idempotent).
void load_dotenv(const std::vector<std::filesystem::path>& extra_search_paths = {});

// Get environment variable, empty string if missing.
std::string get_env(const std::string& key);

// Get environment variable with default fallback.
std::string get_env_or(const std::string& key, const std::string& fallback);

// "1", "true", "yes" and "on" (any case) are true; anything else is the fallback when unset.
bool get_env_bool(const std::string& key, bool fallback);

} // namespace warden::core::config
