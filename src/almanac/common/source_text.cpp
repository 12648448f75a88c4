#include "almanac/common/source_text.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/core.h>

#include "almanac/common/source_span.hpp"

namespace almanac {

SourceText::SourceText(std::string path, std::string content)
    : path_(std::move(path)), content_(std::move(content)) {
  line_starts_.push_back(0);
  for (size_t i = 0; i < content_.size(); ++i) {
    if (content_[i] == '\n') {
      line_starts_.push_back(static_cast<uint32_t>(i + 1));
    }
  }
}

auto SourceText::LineIndex(uint32_t offset) const -> size_t {
  auto it = std::ranges::upper_bound(line_starts_, offset);
  return static_cast<size_t>(it - line_starts_.begin()) - 1;
}

auto SourceText::PositionOf(uint32_t offset) const -> SourcePosition {
  offset = std::min(offset, static_cast<uint32_t>(content_.size()));
  size_t index = LineIndex(offset);
  return SourcePosition{
      .line = static_cast<uint32_t>(index + 1),
      .column = offset - line_starts_[index] + 1,
  };
}

auto SourceText::LineAt(uint32_t offset) const -> std::string_view {
  offset = std::min(offset, static_cast<uint32_t>(content_.size()));
  size_t index = LineIndex(offset);
  size_t begin = line_starts_[index];
  size_t end = index + 1 < line_starts_.size() ? line_starts_[index + 1] - 1
                                               : content_.size();
  std::string_view line(content_.data() + begin, end - begin);
  if (line.ends_with('\r')) {
    line.remove_suffix(1);
  }
  return line;
}

auto SourceText::Describe(const SourceSpan& span) const -> std::string {
  SourcePosition pos = PositionOf(span.begin);
  return fmt::format("{}:{}:{}", path_, pos.line, pos.column);
}

}  // namespace almanac
