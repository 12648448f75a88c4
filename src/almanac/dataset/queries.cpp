#include "almanac/dataset/queries.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "almanac/common/diagnostic/diagnostic.hpp"
#include "almanac/common/interval.hpp"
#include "almanac/common/saturating.hpp"
#include "almanac/mapping/pipeline.hpp"

namespace almanac::dataset {

auto ToRangeQueries(std::span<const uint64_t> seeds)
    -> Result<std::vector<Interval>> {
  if (seeds.size() % 2 != 0) {
    return std::unexpected(
        Diagnostic::Error(
            DiagCode::kUnpairedSeed,
            fmt::format(
                "range mode needs (start, length) pairs, but there are {} "
                "seeds",
                seeds.size()))
            .WithNote(
                fmt::format("last seed {} has no length", seeds.back())));
  }

  std::vector<Interval> ranges;
  ranges.reserve(seeds.size() / 2);
  for (size_t i = 0; i < seeds.size(); i += 2) {
    ranges.push_back(
        Interval{
            .start = seeds[i],
            .end = common::SaturatingAdd(seeds[i], seeds[i + 1]),
        });
  }
  return ranges;
}

auto MinScalarResult(
    const mapping::Pipeline& pipeline, std::span<const uint64_t> values)
    -> Result<uint64_t> {
  if (values.empty()) {
    return std::unexpected(
        Diagnostic::Error(DiagCode::kEmptyQuery, "no values to translate"));
  }

  uint64_t best = pipeline.Translate(values.front());
  for (uint64_t value : values.subspan(1)) {
    best = std::min(best, pipeline.Translate(value));
  }
  return best;
}

auto MinRangeResult(
    const mapping::Pipeline& pipeline, std::vector<Interval> ranges)
    -> Result<uint64_t> {
  auto results = pipeline.TranslateRanges(std::move(ranges));

  std::optional<uint64_t> best;
  for (const auto& interval : results) {
    if (interval.IsEmpty()) continue;
    if (!best || interval.start < *best) {
      best = interval.start;
    }
  }
  if (!best) {
    return std::unexpected(
        Diagnostic::Error(
            DiagCode::kEmptyQuery, "every query interval is empty"));
  }
  return *best;
}

}  // namespace almanac::dataset
