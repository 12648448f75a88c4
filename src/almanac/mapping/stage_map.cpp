#include "almanac/mapping/stage_map.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

#include "almanac/common/interval.hpp"
#include "almanac/common/saturating.hpp"
#include "almanac/mapping/segment.hpp"

namespace almanac::mapping {

StageMap::StageMap(std::vector<Segment> segments)
    : segments_(std::move(segments)) {
  std::ranges::stable_sort(segments_, {}, &Segment::source_start);
  auto dup = std::ranges::unique(segments_, {}, &Segment::source_start);
  segments_.erase(dup.begin(), dup.end());
}

auto StageMap::Translate(uint64_t value) const -> uint64_t {
  for (const auto& segment : segments_) {
    if (segment.Covers(value)) {
      return segment.Translate(value);
    }
    if (segment.source_start > value) {
      break;
    }
  }
  return value;
}

auto StageMap::TranslateRange(Interval range) const -> std::vector<Interval> {
  std::vector<Interval> result;
  TranslateRange(range, result);
  return result;
}

void StageMap::TranslateRange(
    Interval range, std::vector<Interval>& out) const {
  uint64_t current = range.start;
  auto it = segments_.begin();

  while (current < range.end) {
    // Segment lies entirely behind the cursor.
    if (it != segments_.end() && it->SourceEnd() <= current) {
      ++it;
      continue;
    }

    // Nothing left that can touch [current, end).
    if (it == segments_.end() || it->source_start >= range.end) {
      out.push_back(Interval{.start = current, .end = range.end});
      return;
    }

    // Unmapped gap before the segment passes through unchanged.
    if (current < it->source_start) {
      out.push_back(Interval{.start = current, .end = it->source_start});
      current = it->source_start;
    }

    // current is inside *it here.
    uint64_t remaining_in_segment = it->length - (current - it->source_start);
    uint64_t covered = std::min(remaining_in_segment, range.end - current);
    uint64_t start = it->Translate(current);
    out.push_back(
        Interval{.start = start, .end = common::SaturatingAdd(start, covered)});
    current += covered;
  }
}

auto StageMap::FindOverlaps() const -> std::vector<std::pair<size_t, size_t>> {
  std::vector<std::pair<size_t, size_t>> overlaps;
  for (size_t i = 0; i < segments_.size(); ++i) {
    uint64_t end = segments_[i].SourceEnd();
    for (size_t j = i + 1; j < segments_.size(); ++j) {
      if (segments_[j].source_start >= end) break;
      overlaps.emplace_back(i, j);
    }
  }
  return overlaps;
}

}  // namespace almanac::mapping
