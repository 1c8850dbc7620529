#pragma once

#include "pihal/core/common.hpp"

#include <cstdint>
#include <variant>

namespace pihal::hal {

/**
 * @brief 带单位标签的时长（仅作为 Timer::start 的输入，不被保留）。
 *
 * 三种单位最终都归一化为微秒计数；乘法溢出按 uint64 回绕处理
 * （物理上有意义的定时时长远达不到 2^64 us）。
 */
struct Microsecond final {
  std::uint64_t value{0};

  friend constexpr bool operator==(Microsecond, Microsecond) noexcept = default;
};

struct Millisecond final {
  std::uint64_t value{0};
};

struct Second final {
  std::uint64_t value{0};
};

using Timeout = std::variant<Microsecond, Millisecond, Second>;

[[nodiscard]] constexpr Microsecond to_microseconds(Microsecond us) noexcept { return us; }

[[nodiscard]] constexpr Microsecond to_microseconds(Millisecond ms) noexcept {
  return Microsecond{ms.value * 1'000U};
}

[[nodiscard]] constexpr Microsecond to_microseconds(Second s) noexcept {
  return Microsecond{s.value * 1'000'000U};
}

[[nodiscard]] constexpr Microsecond to_microseconds(const Timeout& timeout) noexcept {
  return std::visit([](auto t) constexpr noexcept { return to_microseconds(t); }, timeout);
}

[[nodiscard]] constexpr core::microseconds to_chrono(Microsecond us) noexcept {
  return core::microseconds{us.value};
}

}  // namespace pihal::hal
