#pragma once

#include "pihal/core/common.hpp"
#include "pihal/hal/duration.hpp"

#include <system_error>

namespace pihal::hal {

/**
 * @brief 软件倒计时器（非阻塞轮询）。
 *
 * 状态：
 * - Idle：刚构造，duration = 0，wait() 立即报告到期；
 * - Armed：start(timeout) 之后，deadline = armed_at + duration。
 *
 * 语义：
 * - start()：无条件重新武装（覆盖 armed_at 与 duration），不排队、不继承旧 deadline；
 * - wait()：不阻塞、不修改状态。到期返回空 error_code；未到期返回 errc::would_block。
 *   到期后不会自动重启，后续 wait() 持续报告到期，直到再次 start()。
 *
 * 注意：
 * - 可拷贝，拷贝之间相互独立；
 * - 无内部锁。跨线程共享同一实例需调用方自行同步。
 */
class Timer final {
 public:
  Timer() noexcept;

  void start(const Timeout& timeout);

  [[nodiscard]] std::error_code wait() const noexcept;

  [[nodiscard]] core::time_point armed_at() const noexcept { return armed_at_; }
  [[nodiscard]] Microsecond duration() const noexcept { return duration_; }
  [[nodiscard]] bool is_armed() const noexcept { return duration_.value != 0; }

 private:
  core::time_point armed_at_;
  Microsecond duration_{};
};

}  // namespace pihal::hal
