#pragma once

#include <cstdint>

namespace pihal::core {

/**
 * @brief 日志级别（控制库内 "pihal" logger 的输出）。
 *
 * 说明：
 * - 库内部日志使用 spdlog 的具名 logger "pihal"，不把 spdlog 类型暴露到 public headers；
 * - set_log_level 只作用于该 logger，不改动业务侧的全局 spdlog 配置；
 * - 若业务侧在首次使用前自行注册了名为 "pihal" 的 logger，库会直接复用它。
 */
enum class LogLevel : std::uint8_t {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    critical = 5,
    off = 6,
};

void set_log_level(LogLevel level);
[[nodiscard]] LogLevel log_level();

} // namespace pihal::core
