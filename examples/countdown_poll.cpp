#include <pihal/core/log.hpp>
#include <pihal/hal/delay.hpp>
#include <pihal/hal/timer.hpp>
#include <pihal/i2c/i2c.hpp>

#include <cstdint>
#include <iostream>

using namespace pihal;

int main() {
    std::cout << "=== 倒计时轮询示例 ===\n\n";

    core::set_log_level(core::LogLevel::debug);

    hal::Delay delay;
    hal::Timer timer;

    // 未 start 的 Timer：duration = 0，立即到期
    std::cout << "fresh timer: " << (timer.wait() ? "not ready" : "elapsed") << "\n";

    timer.start(hal::Millisecond{250});

    // 轮询循环：每 20ms 做一次“工作”，直到 250ms 到期
    std::uint32_t polls = 0;
    while (timer.wait()) {
        ++polls;
        delay.delay_ms(std::uint8_t{20});
    }
    std::cout << "elapsed after " << polls << " polls\n";

    // 重新武装会丢弃旧 deadline
    timer.start(hal::Second{10});
    timer.start(hal::Microsecond{500});
    delay.delay_us(std::uint16_t{600});
    std::cout << "re-armed timer: " << (timer.wait() ? "not ready" : "elapsed") << "\n";

    // I2C：只打开总线，不做传输
    auto [ec, bus] = i2c::I2c::open();
    if (ec) {
        std::cerr << "i2c open failed: " << ec.message() << "\n";
        return 0;
    }
    std::cout << "i2c bus " << bus.bus() << " opened at " << bus.path() << "\n";
    return 0;
}
