#pragma once

#include <cstdint>

namespace almanac {

// Byte range [begin, end) in the dataset text being parsed. A run parses one
// dataset, so a span needs no file handle; SourceText resolves it to a line.
struct SourceSpan {
  uint32_t begin = 0;
  uint32_t end = 0;

  [[nodiscard]] auto Length() const -> uint32_t {
    return end > begin ? end - begin : 0;
  }

  // Span of the same width moved by `delta` bytes.
  [[nodiscard]] auto Shifted(uint32_t delta) const -> SourceSpan {
    return SourceSpan{.begin = begin + delta, .end = end + delta};
  }

  auto operator==(const SourceSpan&) const -> bool = default;
};

}  // namespace almanac
