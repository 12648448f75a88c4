#pragma once

#include <cstdint>

#include "almanac/common/saturating.hpp"

namespace almanac::mapping {

// Binds source range [source_start, source_start + length) to the
// destination range starting at destination_start, at a fixed offset.
// Invariant: length > 0 (the dataset layer rejects zero-length lines).
struct Segment {
  uint64_t source_start = 0;
  uint64_t destination_start = 0;
  uint64_t length = 0;

  // Saturates at the top of the identifier domain.
  [[nodiscard]] auto SourceEnd() const -> uint64_t {
    return common::SaturatingAdd(source_start, length);
  }

  [[nodiscard]] auto Covers(uint64_t value) const -> bool {
    return source_start <= value && value < SourceEnd();
  }

  // Precondition: Covers(value). Not checked. Saturates, so a destination
  // range running past the top of the domain collapses onto kMaxId.
  [[nodiscard]] auto Translate(uint64_t value) const -> uint64_t {
    return common::SaturatingAdd(destination_start, value - source_start);
  }

  auto operator==(const Segment&) const -> bool = default;
};

}  // namespace almanac::mapping
