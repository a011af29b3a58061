#include "core/logger.hpp"
#include "core/config.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>

namespace warden::core {

void init_logger() {
    auto logger = spdlog::stderr_color_mt("warden");
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    set_log_level(log_level_from_string(config::get_env_or("WARDEN_LOG_LEVEL", "warn")));
}

void set_log_level(spdlog::level::level_enum level) {
    spdlog::set_level(level);
}

spdlog::level::level_enum log_level_from_string(const std::string& name) {
    if (name == "trace") return spdlog::level::trace;
    if (name == "debug") return spdlog::level::debug;
    if (name == "info") return spdlog::level::info;
    if (name == "warn" || name == "warning") return spdlog::level::warn;
    if (name == "error") return spdlog::level::err;
    if (name == "off") return spdlog::level::off;
    return spdlog::level::info;
}

} // namespace warden::core
