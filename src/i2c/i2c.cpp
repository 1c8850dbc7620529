#include "pihal/i2c/i2c.hpp"

#include "core/logger.hpp"

#include <string>
#include <utility>

namespace pihal::i2c {
namespace {

[[nodiscard]] std::pair<std::error_code, posix::UniqueFd>
open_device(const std::string &path, int extra_flags) noexcept {
    errno = 0;
    const int fd = ::open(path.c_str(), O_RDWR | extra_flags);
    if (fd < 0) {
        return {posix::make_errno_ec(), posix::UniqueFd{}};
    }
    return {std::error_code{}, posix::UniqueFd(fd)};
}

} // namespace

std::pair<std::error_code, I2c>
I2c::open_impl_(const std::string &path, int bus, const I2cOptions &options) {
    auto [ec, fd] = open_device(path, options.open_flags);
    if (ec) {
        core::detail::logger().warn("i2c open {} failed: {}", path, ec.message());
        return {ec, I2c{}};
    }
    core::detail::logger().info("i2c opened {} (fd={})", path, fd.fd);
    return {std::error_code{}, I2c(std::move(fd), path, bus)};
}

std::pair<std::error_code, I2c> I2c::open(std::uint8_t bus,
                                          const I2cOptions &options) {
    return open_impl_(options.device_prefix + std::to_string(bus), bus, options);
}

std::pair<std::error_code, I2c> I2c::open_path(const std::string &path,
                                               const I2cOptions &options) {
    return open_impl_(path, -1, options);
}

} // namespace pihal::i2c
