#pragma once

#include <string>
#include <vector>

#include "input.hpp"

namespace almanac::driver {

// Print the minimal destination value in scalar and/or range mode.
auto Solve(const DatasetInput& input) -> int;

// Print the pipeline output for each of `values`; with `trace`, the value
// in every category along the way.
auto Translate(
    const DatasetInput& input, const std::vector<std::string>& values,
    bool trace) -> int;

// Load and validate the dataset, printing diagnostics and a summary.
auto Check(const DatasetInput& input) -> int;

}  // namespace almanac::driver
