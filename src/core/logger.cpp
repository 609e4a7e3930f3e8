#include "boxpath/core/logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace boxpath {

namespace {

auto make_logger() -> std::shared_ptr<spdlog::logger> {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("boxpath", std::move(sink));
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%s:%#] %v");
    logger->set_level(spdlog::level::info);
    return logger;
}

auto parse_level(std::string_view level) -> spdlog::level::level_enum {
    if (level == "trace") return spdlog::level::trace;
    if (level == "debug") return spdlog::level::debug;
    if (level == "warn") return spdlog::level::warn;
    if (level == "error") return spdlog::level::err;
    if (level == "critical") return spdlog::level::critical;
    if (level == "off") return spdlog::level::off;
    return spdlog::level::info;
}

} // anonymous namespace

auto Logger::get() -> const std::shared_ptr<spdlog::logger>& {
    static const auto logger = make_logger();
    return logger;
}

void Logger::set_level(std::string_view level) {
    get()->set_level(parse_level(level));
}

} // namespace boxpath
