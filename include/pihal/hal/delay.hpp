#pragma once

#include <concepts>
#include <cstdint>

namespace pihal::hal {

// bool 也满足 std::unsigned_integral，这里显式排除。
template <class T>
concept UnsignedCount = std::unsigned_integral<T> && !std::same_as<T, bool>;

/**
 * @brief 阻塞式延时（毫秒/微秒），无状态。
 *
 * 约定：
 * - 只挂起调用线程；不可取消，调用后一定跑满请求时长才返回；
 * - 请求时长是下界：调度抖动可能让实际延时更长，调用方不要依赖亚调度周期精度；
 * - 任意无符号整数宽度（8/16/32/64 bit）均可，内部统一扩宽到 uint64。
 */
class Delay final {
 public:
  Delay() = default;

  template <UnsignedCount T>
  void delay_ms(T ms) const {
    sleep_ms_(static_cast<std::uint64_t>(ms));
  }

  template <UnsignedCount T>
  void delay_us(T us) const {
    sleep_us_(static_cast<std::uint64_t>(us));
  }

 private:
  static void sleep_ms_(std::uint64_t ms);
  static void sleep_us_(std::uint64_t us);
};

}  // namespace pihal::hal
