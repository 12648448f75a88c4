#pragma once

#include <cstdint>
#include <span>
#include <vector>

#include "almanac/common/diagnostic/diagnostic.hpp"
#include "almanac/common/interval.hpp"
#include "almanac/mapping/pipeline.hpp"

namespace almanac::dataset {

// Reinterpret seeds as consecutive (start, length) pairs. The end of each
// interval saturates at the top of the identifier domain. An odd count is a
// kUnpairedSeed error.
auto ToRangeQueries(std::span<const uint64_t> seeds)
    -> Result<std::vector<Interval>>;

// Lowest pipeline output over every value. kEmptyQuery if there is none.
auto MinScalarResult(
    const mapping::Pipeline& pipeline, std::span<const uint64_t> values)
    -> Result<uint64_t>;

// Lowest start among the non-empty intervals the pipeline produces for
// `ranges`. kEmptyQuery if every interval comes out empty.
auto MinRangeResult(
    const mapping::Pipeline& pipeline, std::vector<Interval> ranges)
    -> Result<uint64_t>;

}  // namespace almanac::dataset
