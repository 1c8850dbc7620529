#include <pihal/hal/async_delay.hpp>

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/io_context.hpp>

#include <cstdint>
#include <iostream>

int main() {
    std::cout << "=== 协程延时示例 ===\n\n";

    asio::io_context ioc;
    pihal::hal::AsyncDelay delay(ioc.get_executor());

    asio::co_spawn(
        ioc,
        [&]() -> asio::awaitable<void> {
            for (std::uint32_t i = 0; i < 3; ++i) {
                auto ec = co_await delay.async_delay_ms(100U);
                if (ec) {
                    std::cerr << "delay failed: " << ec.message() << "\n";
                    co_return;
                }
                std::cout << "tick " << i << "\n";
            }
            auto ec = co_await delay.async_delay(pihal::hal::Microsecond{1500});
            std::cout << "final delay: " << (ec ? ec.message() : "ok") << "\n";
        },
        asio::detached);

    ioc.run();
    return 0;
}
