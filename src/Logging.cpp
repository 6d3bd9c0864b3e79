/**
 * @file Logging.cpp
 * @brief spdlog setup for the "strata" logger
 */

#include "strata/Logging.hpp"
#include "strata/Errors.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>
#include <mutex>

namespace strata {

std::shared_ptr<spdlog::logger> logger() {
    static std::once_flag once;
    static std::shared_ptr<spdlog::logger> instance;
    std::call_once(once, [] {
        instance = spdlog::get("strata");
        if (!instance) {
            instance = spdlog::stderr_color_mt("strata");
            instance->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
            instance->set_level(spdlog::level::warn);
        }
    });
    return instance;
}

spdlog::level::level_enum parse_log_level(const std::string& name) {
    std::string x = name;
    std::transform(x.begin(), x.end(), x.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (x == "quiet")
        return spdlog::level::off;
    if (x == "error")
        return spdlog::level::err;
    if (x == "warning" || x == "warn")
        return spdlog::level::warn;
    if (x == "info")
        return spdlog::level::info;
    if (x == "debug")
        return spdlog::level::debug;
    if (x == "trace")
        return spdlog::level::trace;
    throw ConfigError("unknown log level '" + name + "'");
}

void set_log_level(const std::string& name) {
    logger()->set_level(parse_log_level(name));
}

} // namespace strata
