#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/core.h>

namespace almanac::common {

// A broken invariant inside the mapping core, such as a pipeline built over a
// missing stage. Malformed datasets never raise this; they are diagnostics.
class InternalError : public std::logic_error {
 public:
  InternalError(std::string_view component, const std::string& detail)
      : std::logic_error(
            fmt::format(
                "almanac internal error ({}): {}", component, detail)),
        component_(component) {
  }

  [[nodiscard]] auto Component() const -> const std::string& {
    return component_;
  }

 private:
  std::string component_;
};

template <typename... Args>
[[noreturn]] void ThrowInternalError(
    std::string_view component, fmt::format_string<Args...> format,
    Args&&... args) {
  throw InternalError(
      component, fmt::format(format, std::forward<Args>(args)...));
}

}  // namespace almanac::common
