#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <utility>
#include <vector>

#include "almanac/common/interval.hpp"
#include "almanac/mapping/segment.hpp"

namespace almanac::mapping {

// One translation stage: segments sorted by source_start, unique by
// source_start. Values no segment covers map to themselves.
//
// Segments are expected to be disjoint but this is not enforced. When they
// overlap, the covering segment with the lowest source_start wins, in both
// scalar and range mode. FindOverlaps() lets loaders report such data.
class StageMap {
 public:
  StageMap() = default;

  // Sorts by source_start. Of several segments sharing a source_start, the
  // first one in input order is kept.
  explicit StageMap(std::vector<Segment> segments);

  [[nodiscard]] auto Translate(uint64_t value) const -> uint64_t;

  // Translates every value of `range` without enumerating them. The result
  // lists sub-intervals in the order they are met sweeping left to right
  // through `range`; it is not sorted by value. An empty or inverted range
  // yields no intervals.
  [[nodiscard]] auto TranslateRange(Interval range) const
      -> std::vector<Interval>;

  // Same as above, appending to `out`.
  void TranslateRange(Interval range, std::vector<Interval>& out) const;

  // Pairs of segments whose source ranges intersect, by index into
  // Segments(). Empty for well-formed data.
  [[nodiscard]] auto FindOverlaps() const
      -> std::vector<std::pair<size_t, size_t>>;

  [[nodiscard]] auto Segments() const -> std::span<const Segment> {
    return segments_;
  }
  [[nodiscard]] auto Size() const -> size_t {
    return segments_.size();
  }
  [[nodiscard]] auto IsEmpty() const -> bool {
    return segments_.empty();
  }

  auto operator==(const StageMap&) const -> bool = default;

 private:
  std::vector<Segment> segments_;
};

}  // namespace almanac::mapping
