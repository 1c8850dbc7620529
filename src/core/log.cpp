#include "pihal/core/log.hpp"

#include "logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>

namespace pihal::core {
namespace {

[[nodiscard]] spdlog::level::level_enum to_spdlog_level(LogLevel level) noexcept {
    switch (level) {
    case LogLevel::trace:
        return spdlog::level::trace;
    case LogLevel::debug:
        return spdlog::level::debug;
    case LogLevel::info:
        return spdlog::level::info;
    case LogLevel::warn:
        return spdlog::level::warn;
    case LogLevel::error:
        return spdlog::level::err;
    case LogLevel::critical:
        return spdlog::level::critical;
    case LogLevel::off:
        return spdlog::level::off;
    }
    return spdlog::level::off;
}

[[nodiscard]] LogLevel from_spdlog_level(spdlog::level::level_enum level) noexcept {
    switch (level) {
    case spdlog::level::trace:
        return LogLevel::trace;
    case spdlog::level::debug:
        return LogLevel::debug;
    case spdlog::level::info:
        return LogLevel::info;
    case spdlog::level::warn:
        return LogLevel::warn;
    case spdlog::level::err:
        return LogLevel::error;
    case spdlog::level::critical:
        return LogLevel::critical;
    default:
        return LogLevel::off;
    }
}

[[nodiscard]] std::shared_ptr<spdlog::logger> make_logger() {
    if (auto existing = spdlog::get(detail::kLoggerName)) {
        return existing;
    }
    try {
        return spdlog::stderr_color_mt(detail::kLoggerName);
    } catch (const spdlog::spdlog_ex &) {
        // 注册竞争（其他线程/业务侧刚好抢先注册）：回退到 registry 中已有的实例。
        if (auto existing = spdlog::get(detail::kLoggerName)) {
            return existing;
        }
        // registry 不可用时退化为不注册的 logger，保证调用方永远拿到有效引用。
        return std::make_shared<spdlog::logger>(detail::kLoggerName);
    }
}

} // namespace

namespace detail {

spdlog::logger &logger() {
    static const std::shared_ptr<spdlog::logger> instance = make_logger();
    return *instance;
}

} // namespace detail

void set_log_level(LogLevel level) {
    detail::logger().set_level(to_spdlog_level(level));
}

LogLevel log_level() { return from_spdlog_level(detail::logger().level()); }

} // namespace pihal::core
