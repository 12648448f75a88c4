#pragma once

#include <cstdint>
#include <limits>

namespace almanac::common {

inline constexpr uint64_t kMaxId = std::numeric_limits<uint64_t>::max();

// a + b, clamped to kMaxId instead of wrapping.
[[nodiscard]] constexpr auto SaturatingAdd(uint64_t a, uint64_t b)
    -> uint64_t {
  return b > kMaxId - a ? kMaxId : a + b;
}

}  // namespace almanac::common
