/**
 * @file logging.cpp
 * @brief Logger setup
 */

#include "streamiq/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include "streamiq/core/errors.hpp"

namespace streamiq {

namespace detail {

std::shared_ptr<spdlog::logger>& logger() {
    static std::shared_ptr<spdlog::logger> instance = [] {
        auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        auto result = std::make_shared<spdlog::logger>("streamiq", std::move(sink));
        result->set_pattern("%Y-%m-%dT%H:%M:%S.%e %^%l%$ [%t] %v");
        result->set_level(spdlog::level::info);
        return result;
    }();
    return instance;
}

} // namespace detail

void set_log_level(const std::string& level) {
    auto parsed = spdlog::level::from_str(level);
    // from_str maps anything it does not know to off
    if (parsed == spdlog::level::off && level != "off") {
        throw ConfigError("Unknown log level '" + level + "'");
    }
    detail::logger()->set_level(parsed);
}

} // namespace streamiq
