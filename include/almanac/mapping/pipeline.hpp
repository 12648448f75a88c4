#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "almanac/common/interval.hpp"
#include "almanac/mapping/stage_map.hpp"

namespace almanac::mapping {

// Ordered chain of stages. Output of stage i is input of stage i + 1.
//
// The pipeline does not own its stages; whoever built them (normally a
// dataset::Almanac) must outlive it. Immutable after construction, so
// concurrent queries on one instance are safe.
class Pipeline {
 public:
  // Precondition: no null entries.
  explicit Pipeline(std::vector<const StageMap*> stages);

  // Views every element of `stages`, in order.
  explicit Pipeline(std::span<const StageMap> stages);

  [[nodiscard]] auto Translate(uint64_t value) const -> uint64_t;

  // `value` followed by its image after each stage; StageCount() + 1 entries.
  [[nodiscard]] auto Trace(uint64_t value) const -> std::vector<uint64_t>;

  // Range mode. The working set may grow at every stage, bounded by the
  // segment boundaries crossed, never by interval length.
  [[nodiscard]] auto TranslateRanges(std::vector<Interval> ranges) const
      -> std::vector<Interval>;

  [[nodiscard]] auto StageCount() const -> size_t {
    return stages_.size();
  }

 private:
  std::vector<const StageMap*> stages_;
};

}  // namespace almanac::mapping
