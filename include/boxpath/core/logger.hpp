#pragma once

#include <memory>
#include <string_view>

#include <spdlog/spdlog.h>

namespace boxpath {

/// Process-wide library logger writing to stderr.
///
/// The instance is built on first use and never replaced, so it can be
/// reached from any thread. It is not added to the spdlog registry, which
/// leaves the "boxpath" name free for the host application.
class Logger {
public:
    static auto get() -> const std::shared_ptr<spdlog::logger>&;

    /// Accepts trace, debug, info, warn, error, critical and off.
    /// Anything else falls back to info.
    static void set_level(std::string_view level);
};

} // namespace boxpath

#define LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::boxpath::Logger::get(), __VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::boxpath::Logger::get(), __VA_ARGS__)
#define LOG_INFO(...)  SPDLOG_LOGGER_INFO(::boxpath::Logger::get(), __VA_ARGS__)
#define LOG_WARN(...)  SPDLOG_LOGGER_WARN(::boxpath::Logger::get(), __VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::boxpath::Logger::get(), __VA_ARGS__)
#define LOG_FATAL(...) SPDLOG_LOGGER_CRITICAL(::boxpath::Logger::get(), __VA_ARGS__)
