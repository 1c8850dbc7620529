#pragma once

#include <chrono>
#include <cstdint>

namespace pihal::core {

// 所有计时统一使用单调时钟；禁止使用 system_clock（会受校时影响导致 deadline 错乱）。
using steady_clock = std::chrono::steady_clock;
using duration = steady_clock::duration;
using time_point = steady_clock::time_point;

using microseconds = std::chrono::duration<std::uint64_t, std::micro>;
using milliseconds = std::chrono::duration<std::uint64_t, std::milli>;

}  // 命名空间 pihal::core
