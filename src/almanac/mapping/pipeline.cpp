#include "almanac/mapping/pipeline.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "almanac/common/internal_error.hpp"
#include "almanac/common/interval.hpp"
#include "almanac/mapping/stage_map.hpp"

namespace almanac::mapping {

Pipeline::Pipeline(std::vector<const StageMap*> stages)
    : stages_(std::move(stages)) {
  for (size_t i = 0; i < stages_.size(); ++i) {
    if (stages_[i] == nullptr) {
      common::ThrowInternalError(
          "Pipeline", "stage {} of {} is null", i, stages_.size());
    }
  }
}

Pipeline::Pipeline(std::span<const StageMap> stages) {
  stages_.reserve(stages.size());
  for (const auto& stage : stages) {
    stages_.push_back(&stage);
  }
}

auto Pipeline::Translate(uint64_t value) const -> uint64_t {
  for (const auto* stage : stages_) {
    value = stage->Translate(value);
  }
  return value;
}

auto Pipeline::Trace(uint64_t value) const -> std::vector<uint64_t> {
  std::vector<uint64_t> trace;
  trace.reserve(stages_.size() + 1);
  trace.push_back(value);
  for (const auto* stage : stages_) {
    value = stage->Translate(value);
    trace.push_back(value);
  }
  return trace;
}

auto Pipeline::TranslateRanges(std::vector<Interval> ranges) const
    -> std::vector<Interval> {
  std::vector<Interval> next;
  for (size_t i = 0; i < stages_.size(); ++i) {
    next.clear();
    next.reserve(ranges.size());
    for (const auto& range : ranges) {
      stages_[i]->TranslateRange(range, next);
    }
    spdlog::debug(
        "stage {}: {} intervals in, {} out", i, ranges.size(), next.size());
    std::swap(ranges, next);
  }
  return ranges;
}

}  // namespace almanac::mapping
