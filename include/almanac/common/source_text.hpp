#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "almanac/common/source_span.hpp"

namespace almanac {

// 1-based line and column of a byte offset.
struct SourcePosition {
  uint32_t line = 1;
  uint32_t column = 1;

  auto operator==(const SourcePosition&) const -> bool = default;
};

// The dataset text of one run, kept after parsing so diagnostics can quote
// the offending line. Line starts are indexed once on construction.
class SourceText {
 public:
  SourceText(std::string path, std::string content);

  [[nodiscard]] auto Path() const -> const std::string& {
    return path_;
  }
  [[nodiscard]] auto Content() const -> std::string_view {
    return content_;
  }
  [[nodiscard]] auto LineCount() const -> uint32_t {
    return static_cast<uint32_t>(line_starts_.size());
  }

  // Offsets past the end resolve to the last line.
  [[nodiscard]] auto PositionOf(uint32_t offset) const -> SourcePosition;

  // Text of the line holding `offset`, without its '\n' or a trailing '\r'.
  [[nodiscard]] auto LineAt(uint32_t offset) const -> std::string_view;

  // "path:line:col" of the span start.
  [[nodiscard]] auto Describe(const SourceSpan& span) const -> std::string;

 private:
  [[nodiscard]] auto LineIndex(uint32_t offset) const -> size_t;

  std::string path_;
  std::string content_;
  std::vector<uint32_t> line_starts_;  // Always holds at least offset 0
};

}  // namespace almanac
