#pragma once

#include <unistd.h>

#include <cerrno>
#include <system_error>

namespace pihal::posix {

/**
 * @brief 简单的 fd RAII（析构时 close）。
 */
struct UniqueFd final {
    int fd{-1};

    UniqueFd() = default;
    explicit UniqueFd(int v) : fd(v) {}

    UniqueFd(const UniqueFd &) = delete;
    UniqueFd &operator=(const UniqueFd &) = delete;

    UniqueFd(UniqueFd &&o) noexcept : fd(o.fd) { o.fd = -1; }
    UniqueFd &operator=(UniqueFd &&o) noexcept {
        if (this == &o) {
            return *this;
        }
        reset(o.release());
        return *this;
    }

    ~UniqueFd() { reset(); }

    void reset(int new_fd = -1) noexcept {
        if (fd >= 0) {
            ::close(fd);
        }
        fd = new_fd;
    }

    [[nodiscard]] int release() noexcept {
        const int out = fd;
        fd = -1;
        return out;
    }

    [[nodiscard]] bool valid() const noexcept { return fd >= 0; }
};

[[nodiscard]] inline std::error_code make_errno_ec() noexcept {
    return std::error_code(errno, std::generic_category());
}

} // namespace pihal::posix
