#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "almanac/common/diagnostic/diagnostic.hpp"
#include "almanac/common/diagnostic/diagnostic_sink.hpp"
#include "almanac/common/source_span.hpp"
#include "almanac/dataset/almanac.hpp"
#include "almanac/mapping/segment.hpp"
#include "almanac/mapping/stage_map.hpp"

namespace almanac::dataset {

// Parse "destination_start source_start length". Tokens are separated by
// spaces or tabs. `line_span` locates `line` in the dataset text; spans in
// the returned diagnostic are derived from it.
auto ParseSegmentLine(std::string_view line, SourceSpan line_span)
    -> Result<mapping::Segment>;

// Build a stage from segment lines that have already had blank lines
// removed. The first malformed line fails the whole stage.
auto BuildStageMap(const std::vector<std::string>& lines)
    -> Result<mapping::StageMap>;

// Parse a complete almanac file:
//
//   seeds: 79 14 55 13
//
//   seed-to-soil map:
//   50 98 2
//   52 50 48
//   ...
//
// Every problem found is reported to `sink`, not just the first. Overlapping
// and duplicate segments and empty stages are warnings. Returns nullopt if
// any error was reported.
auto ParseAlmanac(std::string_view content, DiagnosticSink& sink)
    -> std::optional<Almanac>;

}  // namespace almanac::dataset
