#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "almanac/common/source_span.hpp"
#include "almanac/mapping/pipeline.hpp"
#include "almanac/mapping/stage_map.hpp"

namespace almanac::dataset {

// One "<source>-to-<destination> map:" section.
struct Stage {
  std::string source_category;
  std::string destination_category;
  mapping::StageMap map;
  SourceSpan header_span;
};

// A parsed dataset: the seed list plus a chain of stages, each stage's
// destination category being the next stage's source category.
struct Almanac {
  std::vector<uint64_t> seeds;
  std::vector<Stage> stages;

  // The returned pipeline points into `stages`; it must not outlive this
  // Almanac, and `stages` must not be modified while it is in use.
  [[nodiscard]] auto BuildPipeline() const -> mapping::Pipeline;

  // Category of the first stage's input ("seed" for the usual data).
  [[nodiscard]] auto SourceCategory() const -> std::string_view;

  // Category of the last stage's output ("location" for the usual data).
  [[nodiscard]] auto DestinationCategory() const -> std::string_view;

  [[nodiscard]] auto SegmentCount() const -> size_t;
};

}  // namespace almanac::dataset
