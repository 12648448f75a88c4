#include "load.hpp"

#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <utility>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "almanac/common/diagnostic/diagnostic_sink.hpp"
#include "almanac/common/source_text.hpp"
#include "almanac/dataset/parser.hpp"
#include "print.hpp"

namespace almanac::driver {

namespace {

auto ReadFile(const std::string& path) -> std::optional<std::string> {
  if (!std::filesystem::is_regular_file(path)) {
    return std::nullopt;
  }
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return std::nullopt;
  }
  std::ostringstream contents;
  contents << in.rdbuf();
  return contents.str();
}

}  // namespace

auto LoadAlmanac(const DatasetInput& input) -> std::optional<LoadedAlmanac> {
  auto content = ReadFile(input.file);
  if (!content) {
    PrintError(fmt::format("cannot read '{}'", input.file));
    return std::nullopt;
  }

  SourceText source(input.file, std::move(*content));

  DiagnosticSink sink;
  auto almanac = dataset::ParseAlmanac(source.Content(), sink);
  if (input.warnings_as_errors && sink.WarningCount() > 0) {
    sink.PromoteWarnings();
  }
  PrintDiagnostics(sink, &source);
  if (!almanac || sink.HasErrors()) {
    return std::nullopt;
  }

  spdlog::debug(
      "loaded {}: {} seeds, {} stages, {} segments", input.file,
      almanac->seeds.size(), almanac->stages.size(), almanac->SegmentCount());

  return LoadedAlmanac{
      .source = std::move(source),
      .almanac = std::move(*almanac),
      .warning_count = sink.WarningCount(),
  };
}

}  // namespace almanac::driver
