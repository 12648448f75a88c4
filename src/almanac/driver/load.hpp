#pragma once

#include <cstddef>
#include <optional>

#include "almanac/common/source_text.hpp"
#include "almanac/dataset/almanac.hpp"
#include "input.hpp"

namespace almanac::driver {

struct LoadedAlmanac {
  SourceText source;
  dataset::Almanac almanac;
  size_t warning_count = 0;
};

// Read and parse the dataset named by `input`, printing every diagnostic.
// Returns nullopt if the file cannot be read or has errors (including
// warnings under --Werror).
auto LoadAlmanac(const DatasetInput& input) -> std::optional<LoadedAlmanac>;

}  // namespace almanac::driver
