#pragma once

#include "pihal/core/common.hpp"
#include "pihal/hal/delay.hpp"
#include "pihal/hal/duration.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <asio/steady_timer.hpp>

#include <cstdint>
#include <system_error>

namespace pihal::hal {

/**
 * @brief 协程版延时（基于 asio::steady_timer，返回 std::error_code）。
 *
 * 供运行在 asio 执行器上的驱动使用：等待期间不阻塞线程。
 *
 * 约定：
 * - 正常到期：返回空 error_code
 * - cancel()：等待者返回 errc::cancelled
 * - 其他底层错误：透传
 * - 单个对象同一时刻只服务一个等待者（一次性延时，不是调度器）
 */
class AsyncDelay final {
 public:
  explicit AsyncDelay(asio::any_io_executor ex);

  void cancel() noexcept;

  template <UnsignedCount T>
  asio::awaitable<std::error_code> async_delay_ms(T ms) {
    return async_sleep_(saturating_ms_to_us_(static_cast<std::uint64_t>(ms)));
  }

  template <UnsignedCount T>
  asio::awaitable<std::error_code> async_delay_us(T us) {
    return async_sleep_(core::microseconds{static_cast<std::uint64_t>(us)});
  }

  asio::awaitable<std::error_code> async_delay(const Timeout& timeout) {
    return async_sleep_(to_chrono(to_microseconds(timeout)));
  }

  // steady_timer 能表示的最长等待（有符号纳秒上限换算到微秒）。
  // 超过该值的请求截断到它，等价于“永不到期”，只能被 cancel() 结束。
  [[nodiscard]] static core::microseconds max_wait() noexcept;

 private:
  [[nodiscard]] static core::microseconds saturating_ms_to_us_(std::uint64_t ms) noexcept;

  asio::awaitable<std::error_code> async_sleep_(core::microseconds us);

  asio::steady_timer timer_;
};

}  // namespace pihal::hal
