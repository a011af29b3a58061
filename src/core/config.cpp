#include "core/config.hpp"
#include "core/paths.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <spdlog/spdlog.h>

namespace warden::core::config {

namespace {

std::string trim(const std::string& s, const char* ws = " \t\r\n") {
    size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos) return {};
    size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

} // namespace

std::optional<std::pair<std::string, std::string>> parse_dotenv_line(const std::string& raw) {
    std::string line = trim(raw);
    if (line.empty() || line[0] == '#') return std::nullopt;

    // Accept shell-style "export KEY=VALUE"
    if (line.rfind("export ", 0) == 0) {
        line = trim(line.substr(7));
    }

    size_t eq_pos = line.find('=');
    if (eq_pos == std::string::npos) return std::nullopt;

    std::string key = trim(line.substr(0, eq_pos), " \t");
    std::string value = trim(line.substr(eq_pos + 1));
    if (key.empty()) return std::nullopt;

    if (value.size() >= 2) {
        if ((value.front() == '"' && value.back() == '"') ||
            (value.front() == '\'' && value.back() == '\'')) {
            value = value.substr(1, value.size() - 2);
        }
    }
    return std::make_pair(key, value);
}

std::optional<size_t> apply_dotenv_file(const std::filesystem::path& env_path) {
    std::ifstream file(env_path);
    if (!file) {
        return std::nullopt;
    }

    size_t applied = 0;
    std::string line;
    while (std::getline(file, line)) {
        auto entry = parse_dotenv_line(line);
        if (!entry) continue;
        if (std::getenv(entry->first.c_str()) != nullptr) continue;
        if (setenv(entry->first.c_str(), entry->second.c_str(), 0) == 0) {
            applied++;
        }
    }
    spdlog::debug("Loaded {} variables from {}", applied, env_path.string());
    return applied;
}

void load_dotenv(const std::vector<std::filesystem::path>& extra_search_paths) {
    static bool loaded = false;
    if (loaded) return;
    loaded = true;

    std::vector<std::filesystem::path> search_paths = paths::project_search_paths();
    for (const auto& p : extra_search_paths) {
        search_paths.push_back(p);
    }

    for (const auto& base : search_paths) {
        auto env_path = base / ".env";
        std::error_code ec;
        if (!std::filesystem::is_regular_file(env_path, ec)) {
            continue;
        }
        if (apply_dotenv_file(env_path)) {
            break;
        }
    }
}

std::string get_env(const std::string& key) {
    const char* value = std::getenv(key.c_str());
    return value ? std::string(value) : std::string();
}

std::string get_env_or(const std::string& key, const std::string& fallback) {
    auto value = get_env(key);
    return value.empty() ? fallback : value;
}

bool get_env_bool(const std::string& key, bool fallback) {
    auto value = get_env(key);
    if (value.empty()) return fallback;
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value == "1" || value == "true" || value == "yes" || value == "on";
}

} // namespace warden::core::config
