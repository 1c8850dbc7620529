#include "pihal/core/error.hpp"

#include <string>

namespace pihal::core {
namespace {

class pihal_error_category final : public std::error_category {
 public:
  const char* name() const noexcept override { return "pihal.core"; }

  std::string message(int ev) const override {
    switch (static_cast<errc>(ev)) {
      case errc::ok:
        return "ok";
      case errc::would_block:
        return "would block";
      case errc::cancelled:
        return "cancelled";
      default:
        return "unknown pihal.core error";
    }
  }
};

}  // 匿名命名空间

const std::error_category& error_category() noexcept {
  static pihal_error_category category;
  return category;
}

std::error_code make_error_code(errc e) noexcept {
  return {static_cast<int>(e), error_category()};
}

}  // 命名空间 pihal::core
