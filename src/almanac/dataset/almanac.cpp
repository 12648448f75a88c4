#include "almanac/dataset/almanac.hpp"

#include <cstddef>
#include <string_view>
#include <utility>
#include <vector>

#include "almanac/mapping/pipeline.hpp"
#include "almanac/mapping/stage_map.hpp"

namespace almanac::dataset {

auto Almanac::BuildPipeline() const -> mapping::Pipeline {
  std::vector<const mapping::StageMap*> maps;
  maps.reserve(stages.size());
  for (const auto& stage : stages) {
    maps.push_back(&stage.map);
  }
  return mapping::Pipeline(std::move(maps));
}

auto Almanac::SourceCategory() const -> std::string_view {
  if (stages.empty()) return {};
  return stages.front().source_category;
}

auto Almanac::DestinationCategory() const -> std::string_view {
  if (stages.empty()) return {};
  return stages.back().destination_category;
}

auto Almanac::SegmentCount() const -> size_t {
  size_t count = 0;
  for (const auto& stage : stages) {
    count += stage.map.Size();
  }
  return count;
}

}  // namespace almanac::dataset
