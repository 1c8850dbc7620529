#pragma once

/*
 * Linux I2C 总线句柄（/dev/i2c-N）。
 *
 * 范围：
 * - 只负责打开/持有/关闭总线设备节点；
 * - 不提供 ioctl(I2C_SLAVE)、读写等传输操作。
 */

#include "pihal/posix/unique_fd.hpp"

#include <fcntl.h>

#include <cstdint>
#include <string>
#include <system_error>
#include <utility>

namespace pihal::i2c {

struct I2cOptions final {
    // 设备节点前缀，最终路径为 device_prefix + 总线号。
    std::string device_prefix{"/dev/i2c-"};
    // 额外的 open(2) 标志（O_RDWR 总是带上）。
    int open_flags{O_CLOEXEC};
};

// 树莓派上用户可用的 I2C 总线。
inline constexpr std::uint8_t kDefaultBus = 1;

/**
 * @brief I2C 总线句柄（独占 fd，move-only）。
 *
 * 打开失败时 open()/open_path() 返回的句柄是“无效”占位（is_open() == false），
 * 错误码为底层 errno（std::generic_category()），原样交给调用方决定是否重试。
 * 这是 I2C 唯一的错误来源：空路径等非法输入同样由 open(2) 以 errno 报告。
 */
class I2c final {
public:
    // 创建一个“无效”的句柄（仅用于 open() 失败时作为占位返回值）。
    I2c() = default;

    I2c(const I2c &) = delete;
    I2c &operator=(const I2c &) = delete;
    I2c(I2c &&) noexcept = default;
    I2c &operator=(I2c &&) noexcept = default;
    ~I2c() = default;

    [[nodiscard]] static std::pair<std::error_code, I2c>
    open(std::uint8_t bus = kDefaultBus, const I2cOptions &options = {});

    [[nodiscard]] static std::pair<std::error_code, I2c>
    open_path(const std::string &path, const I2cOptions &options = {});

    [[nodiscard]] bool is_open() const noexcept { return fd_.valid(); }
    [[nodiscard]] int native_handle() const noexcept { return fd_.fd; }
    [[nodiscard]] const std::string &path() const noexcept { return path_; }

    // open_path() 打开的句柄总线号未知，返回 -1。
    [[nodiscard]] int bus() const noexcept { return bus_; }

private:
    [[nodiscard]] static std::pair<std::error_code, I2c>
    open_impl_(const std::string &path, int bus, const I2cOptions &options);

    I2c(posix::UniqueFd fd, std::string path, int bus)
        : fd_(std::move(fd)), path_(std::move(path)), bus_(bus) {}

    posix::UniqueFd fd_{};
    std::string path_{};
    int bus_{-1};
};

} // namespace pihal::i2c
