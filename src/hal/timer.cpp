#include "pihal/hal/timer.hpp"

#include "pihal/core/error.hpp"

#include "core/logger.hpp"

#include <chrono>

namespace pihal::hal {

Timer::Timer() noexcept : armed_at_(core::steady_clock::now()) {}

void Timer::start(const Timeout& timeout) {
  duration_ = to_microseconds(timeout);
  armed_at_ = core::steady_clock::now();
  core::detail::logger().trace("timer armed for {} us", duration_.value);
}

std::error_code Timer::wait() const noexcept {
  // 在微秒域内比较：steady_clock 的差值非负，转成 uint64 计数后与 duration 直接比较，
  // 避免把超大 duration 换算到纳秒时溢出。
  const auto elapsed =
    std::chrono::duration_cast<core::microseconds>(core::steady_clock::now() - armed_at_);
  if (elapsed.count() >= duration_.value) {
    return {};
  }
  return core::make_error_code(core::errc::would_block);
}

}  // namespace pihal::hal
