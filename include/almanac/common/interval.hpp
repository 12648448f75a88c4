#pragma once

#include <cstdint>
#include <ostream>
#include <string>

#include <fmt/core.h>

namespace almanac {

// Half-open range [start, end) of identifiers. start >= end is empty.
struct Interval {
  uint64_t start = 0;
  uint64_t end = 0;

  [[nodiscard]] auto IsEmpty() const -> bool {
    return start >= end;
  }
  [[nodiscard]] auto Length() const -> uint64_t {
    return IsEmpty() ? 0 : end - start;
  }
  [[nodiscard]] auto Contains(uint64_t value) const -> bool {
    return start <= value && value < end;
  }
  [[nodiscard]] auto ToString() const -> std::string {
    return fmt::format("[{}, {})", start, end);
  }

  auto operator==(const Interval&) const -> bool = default;
};

inline auto operator<<(std::ostream& os, const Interval& interval)
    -> std::ostream& {
  return os << interval.ToString();
}

}  // namespace almanac
