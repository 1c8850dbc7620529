#include "pihal/hal/delay.hpp"

#include "pihal/core/common.hpp"

#include "core/logger.hpp"

#include <thread>

namespace pihal::hal {

void Delay::sleep_ms_(std::uint64_t ms) {
  core::detail::logger().debug("delay {} ms", ms);
  std::this_thread::sleep_for(core::milliseconds{ms});
}

void Delay::sleep_us_(std::uint64_t us) {
  core::detail::logger().debug("delay {} us", us);
  std::this_thread::sleep_for(core::microseconds{us});
}

}  // namespace pihal::hal
