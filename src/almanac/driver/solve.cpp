#include "solve.hpp"

#include <charconv>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "almanac/common/diagnostic/diagnostic.hpp"
#include "almanac/dataset/almanac.hpp"
#include "almanac/dataset/queries.hpp"
#include "load.hpp"
#include "print.hpp"
#include "verbose_logger.hpp"

namespace almanac::driver {

namespace {

auto ParseValue(const std::string& text) -> std::optional<uint64_t> {
  uint64_t value = 0;
  const char* last = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(text.data(), last, value);
  if (ec != std::errc{} || ptr != last) {
    return std::nullopt;
  }
  return value;
}

auto FormatChain(const dataset::Almanac& almanac) -> std::string {
  std::string chain(almanac.SourceCategory());
  for (const auto& stage : almanac.stages) {
    chain += " -> ";
    chain += stage.destination_category;
  }
  return chain;
}

}  // namespace

auto Solve(const DatasetInput& input) -> int {
  VerboseLogger vlog(input.verbose);

  std::optional<LoadedAlmanac> loaded;
  {
    PhaseTimer timer(vlog, "load");
    loaded = LoadAlmanac(input);
  }
  if (!loaded) {
    return 1;
  }

  const dataset::Almanac& almanac = loaded->almanac;
  auto pipeline = almanac.BuildPipeline();
  auto category = almanac.DestinationCategory();
  int status = 0;

  if (input.mode != SolveMode::kRange) {
    Result<uint64_t> result;
    {
      PhaseTimer timer(vlog, "scalar");
      result = dataset::MinScalarResult(pipeline, almanac.seeds);
    }
    if (result) {
      fmt::print("minimal {}: {}\n", category, *result);
    } else {
      PrintDiagnostic(result.error());
      status = 1;
    }
  }

  if (input.mode != SolveMode::kScalar) {
    auto ranges = dataset::ToRangeQueries(almanac.seeds);
    if (!ranges) {
      PrintDiagnostic(ranges.error());
      status = 1;
    } else {
      Result<uint64_t> result;
      {
        PhaseTimer timer(vlog, "range");
        result = dataset::MinRangeResult(pipeline, std::move(*ranges));
      }
      if (result) {
        fmt::print("minimal {} with ranges: {}\n", category, *result);
      } else {
        PrintDiagnostic(result.error());
        status = 1;
      }
    }
  }

  if (input.stats) {
    vlog.PrintPhaseSummary();
  }
  return status;
}

auto Translate(
    const DatasetInput& input, const std::vector<std::string>& values,
    bool trace) -> int {
  if (values.empty()) {
    PrintError("no values to translate");
    return 1;
  }

  std::vector<uint64_t> parsed;
  parsed.reserve(values.size());
  for (const auto& text : values) {
    auto value = ParseValue(text);
    if (!value) {
      PrintError(
          fmt::format(
              "invalid value '{}': expected a non-negative integer", text));
      return 1;
    }
    parsed.push_back(*value);
  }

  VerboseLogger vlog(input.verbose);
  std::optional<LoadedAlmanac> loaded;
  {
    PhaseTimer timer(vlog, "load");
    loaded = LoadAlmanac(input);
  }
  if (!loaded) {
    return 1;
  }

  const dataset::Almanac& almanac = loaded->almanac;
  auto pipeline = almanac.BuildPipeline();

  PhaseTimer timer(vlog, "translate");
  for (uint64_t value : parsed) {
    if (!trace) {
      fmt::print("{} -> {}\n", value, pipeline.Translate(value));
      continue;
    }
    auto steps = pipeline.Trace(value);
    std::string line = fmt::format("{} {}", almanac.SourceCategory(), steps[0]);
    for (size_t i = 0; i < almanac.stages.size(); ++i) {
      line += fmt::format(
          " -> {} {}", almanac.stages[i].destination_category, steps[i + 1]);
    }
    fmt::print("{}\n", line);
  }
  return 0;
}

auto Check(const DatasetInput& input) -> int {
  VerboseLogger vlog(input.verbose);

  std::optional<LoadedAlmanac> loaded;
  {
    PhaseTimer timer(vlog, "load");
    loaded = LoadAlmanac(input);
  }
  if (!loaded) {
    return 1;
  }

  const dataset::Almanac& almanac = loaded->almanac;
  if (almanac.seeds.empty()) {
    PrintWarning("no seeds; 'solve' has nothing to translate");
  } else if (almanac.seeds.size() % 2 != 0) {
    PrintWarning("odd number of seeds; range mode needs (start, length) pairs");
  }

  fmt::print(
      "{}: {} seeds, {} stages, {} segments\n", input.file,
      almanac.seeds.size(), almanac.stages.size(), almanac.SegmentCount());
  fmt::print("{}\n", FormatChain(almanac));
  return 0;
}

}  // namespace almanac::driver
