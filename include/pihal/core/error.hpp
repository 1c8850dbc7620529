#pragma once

#include <system_error>

namespace pihal::core {

/**
 * @brief 本库通用错误码（跨模块复用）。
 *
 * 约定：
 * - 所有可失败/可轮询的接口返回 std::error_code，不走异常路径。
 * - would_block：轮询类 API 的“尚未就绪”，可重试，不代表失败。
 * - cancelled：异步等待被 cancel() 主动取消。
 * - 系统调用失败直接返回 std::generic_category() 下的 errno，不做二次映射。
 */
enum class errc : int {
  ok = 0,
  would_block = 1,
  cancelled = 2,
};

const std::error_category& error_category() noexcept;
std::error_code make_error_code(errc e) noexcept;

}  // namespace pihal::core

namespace std {
template <>
struct is_error_code_enum<pihal::core::errc> : true_type {};
}  // namespace std
