#pragma once

// 库内部使用：不安装、不出现在 public headers 中。

#include <spdlog/spdlog.h>

namespace pihal::core::detail {

inline constexpr const char *kLoggerName = "pihal";

// 懒创建（首次调用时注册到 spdlog registry），线程安全。
// 首次调用可能分配内存失败并抛出 std::bad_alloc，因此不是 noexcept。
spdlog::logger &logger();

} // namespace pihal::core::detail
