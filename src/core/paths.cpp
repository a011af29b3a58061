#include "core/paths.hpp"
#include <unistd.h>
#include <limits.h>

namespace warden::core::paths {

std::filesystem::path executable_path() {
    char buf[PATH_MAX];
    ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (len <= 0) {
        return {};
    }
    buf[len] = '\0';
    return std::filesystem::path(buf);
}

std::filesystem::path executable_dir() {
    auto exe = executable_path();
    if (exe.empty()) {
        return {};
    }
    return exe.parent_path();
}

std::vector<std::filesystem::path> project_search_paths() {
    std::vector<std::filesystem::path> roots;
    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    if (!ec) {
        roots.push_back(cwd);
        if (auto repo = find_repository_root(cwd)) {
            roots.push_back(*repo);
        }
    }

    auto exe_dir = executable_dir();
    if (!exe_dir.empty()) {
        roots.push_back(exe_dir);
        roots.push_back(exe_dir.parent_path());
    }

    // De-duplicate while preserving order.
    std::vector<std::filesystem::path> unique;
    for (const auto& p : roots) {
        if (p.empty()) continue;
        bool seen = false;
        for (const auto& u : unique) {
            if (u == p) {
                seen = true;
                break;
            }
        }
        if (!seen) {
            unique.push_back(p);
        }
    }
    return unique;
}

std::optional<std::filesystem::path> find_repository_root(const std::filesystem::path& start) {
    std::error_code ec;
    auto dir = std::filesystem::absolute(start, ec);
    if (ec) {
        return std::nullopt;
    }
    if (!std::filesystem::is_directory(dir, ec)) {
        dir = dir.parent_path();
    }

    while (!dir.empty()) {
        if (std::filesystem::is_directory(dir / ".github", ec)) {
            return dir;
        }
        auto parent = dir.parent_path();
        if (parent == dir) break;
        dir = parent;
    }
    return std::nullopt;
}

std::string workflow_id_from_path(const std::filesystem::path& path) {
    std::string name = path.filename().string();
    for (const char* suffix : {".lock.yml", ".yml", ".md", ".json"}) {
        std::string s(suffix);
        if (name.size() > s.size() && name.compare(name.size() - s.size(), s.size(), s) == 0) {
            return name.substr(0, name.size() - s.size());
        }
    }
    return name;
}

} // namespace warden::core::paths
