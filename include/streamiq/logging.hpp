#pragma once

/**
 * @file logging.hpp
 * @brief Project logger and logging macros
 *
 * STREAMIQ_TRACE -> spdlog::trace
 * STREAMIQ_DEBUG -> spdlog::debug
 * STREAMIQ_INFO  -> spdlog::info
 * STREAMIQ_WARN  -> spdlog::warn
 * STREAMIQ_ERROR -> spdlog::err
 */

#ifndef SPDLOG_ACTIVE_LEVEL
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#endif

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace streamiq {

namespace detail {

/**
 * @brief Shared logger, created on first use with a colored stderr sink
 */
std::shared_ptr<spdlog::logger>& logger();

} // namespace detail

/**
 * @brief Set the runtime level by name (trace, debug, info, warn, error, off)
 * @throws ConfigError for an unknown name
 */
void set_log_level(const std::string& level);

} // namespace streamiq

#define STREAMIQ_TRACE(...) SPDLOG_LOGGER_TRACE(::streamiq::detail::logger(), __VA_ARGS__)
#define STREAMIQ_DEBUG(...) SPDLOG_LOGGER_DEBUG(::streamiq::detail::logger(), __VA_ARGS__)
#define STREAMIQ_INFO(...) SPDLOG_LOGGER_INFO(::streamiq::detail::logger(), __VA_ARGS__)
#define STREAMIQ_WARN(...) SPDLOG_LOGGER_WARN(::streamiq::detail::logger(), __VA_ARGS__)
#define STREAMIQ_ERROR(...) SPDLOG_LOGGER_ERROR(::streamiq::detail::logger(), __VA_ARGS__)
