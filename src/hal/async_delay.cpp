#include "pihal/hal/async_delay.hpp"

#include "pihal/core/error.hpp"

#include "core/logger.hpp"

#include <asio/as_tuple.hpp>
#include <asio/error.hpp>
#include <asio/use_awaitable.hpp>

#include <algorithm>
#include <chrono>

namespace pihal::hal {

AsyncDelay::AsyncDelay(asio::any_io_executor ex) : timer_(ex) {}

void AsyncDelay::cancel() noexcept {
  timer_.cancel();
}

core::microseconds AsyncDelay::max_wait() noexcept {
  return std::chrono::duration_cast<core::microseconds>(core::duration::max());
}

core::microseconds AsyncDelay::saturating_ms_to_us_(std::uint64_t ms) noexcept {
  // 先在毫秒域比较，避免 ms * 1000 在 uint64 内回绕成一个小值
  const auto limit_ms = max_wait().count() / 1'000U;
  if (ms > limit_ms) {
    return max_wait();
  }
  return core::microseconds{ms * 1'000U};
}

asio::awaitable<std::error_code> AsyncDelay::async_sleep_(core::microseconds us) {
  // core::duration 是有符号纳秒：未截断的超大请求会回绕成负数，timer 立即到期。
  const auto wait = std::min(us, max_wait());
  core::detail::logger().debug("async delay {} us", wait.count());

  timer_.expires_after(std::chrono::duration_cast<core::duration>(wait));
  auto [ec] = co_await timer_.async_wait(asio::as_tuple(asio::use_awaitable));
  if (ec == asio::error::operation_aborted) {
    core::detail::logger().debug("async delay cancelled");
    co_return core::make_error_code(core::errc::cancelled);
  }
  // 正常到期返回空 error_code；其他底层错误原样透传
  co_return ec;
}

}  // namespace pihal::hal
