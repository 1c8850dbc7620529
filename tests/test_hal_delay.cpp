#include "pihal/hal/delay.hpp"

#include "test_main.hpp"

#include <chrono>
#include <cstdint>
#include <thread>
#include <vector>

namespace {

using pihal::hal::Delay;
using pihal::tests::Stopwatch;

using namespace std::chrono_literals;

static_assert(pihal::hal::UnsignedCount<std::uint8_t>);
static_assert(pihal::hal::UnsignedCount<std::uint64_t>);
static_assert(!pihal::hal::UnsignedCount<int>);
static_assert(!pihal::hal::UnsignedCount<bool>);
static_assert(!pihal::hal::UnsignedCount<double>);

template <class T>
void check_delay_ms(T ms) {
  const Delay delay{};
  Stopwatch sw;
  delay.delay_ms(ms);
  TEST_EXPECT_AT_LEAST(sw.elapsed(), std::chrono::milliseconds(ms));
}

template <class T>
void check_delay_us(T us) {
  const Delay delay{};
  Stopwatch sw;
  delay.delay_us(us);
  TEST_EXPECT_AT_LEAST(sw.elapsed(), std::chrono::microseconds(us));
}

void test_delay_ms_all_widths() {
  check_delay_ms(std::uint8_t{5});
  check_delay_ms(std::uint16_t{10});
  check_delay_ms(std::uint32_t{15});
  check_delay_ms(std::uint64_t{20});
}

void test_delay_us_all_widths() {
  check_delay_us(std::uint8_t{200});
  check_delay_us(std::uint16_t{1'500});
  check_delay_us(std::uint32_t{3'000});
  check_delay_us(std::uint64_t{5'000});
}

void test_zero_delay_returns() {
  const Delay delay{};
  Stopwatch sw;
  delay.delay_ms(0U);
  delay.delay_us(0U);
  TEST_EXPECT(sw.elapsed() < 50ms);
}

void test_delay_100ms_end_to_end() {
  Delay delay;
  Stopwatch sw;
  delay.delay_ms(std::uint32_t{100});
  const auto elapsed = sw.elapsed();
  TEST_EXPECT_AT_LEAST(elapsed, 100ms);
  // 上界给足余量：只用于发现“完全没按毫秒处理”之类的错误
  TEST_EXPECT(elapsed < 100ms + 400ms);
}

void test_concurrent_callers_block_independently() {
  // 各线程独立阻塞：总耗时接近单次延时，而不是累加
  Stopwatch sw;
  std::vector<std::thread> threads;
  for (int i = 0; i < 4; ++i) {
    threads.emplace_back([] { Delay{}.delay_ms(std::uint16_t{50}); });
  }
  for (auto& t : threads) {
    t.join();
  }
  const auto elapsed = sw.elapsed();
  TEST_EXPECT_AT_LEAST(elapsed, 50ms);
  TEST_EXPECT(elapsed < 190ms);
}

}  // namespace

int main() {
  test_delay_ms_all_widths();
  test_delay_us_all_widths();
  test_zero_delay_returns();
  test_delay_100ms_end_to_end();
  test_concurrent_callers_block_independently();
  return ::pihal::tests::run_and_report();
}
