#include "almanac/dataset/parser.hpp"

#include <charconv>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "almanac/common/diagnostic/diagnostic.hpp"
#include "almanac/common/diagnostic/diagnostic_sink.hpp"
#include "almanac/common/source_span.hpp"
#include "almanac/dataset/almanac.hpp"
#include "almanac/mapping/segment.hpp"
#include "almanac/mapping/stage_map.hpp"

namespace almanac::dataset {

namespace {

constexpr std::string_view kSeedsPrefix = "seeds:";
constexpr std::string_view kHeaderSuffix = "map:";
constexpr std::string_view kCategorySeparator = "-to-";
constexpr std::string_view kBlanks = " \t\r";

auto IsBlank(char c) -> bool {
  return c == ' ' || c == '\t' || c == '\r';
}

auto IsDigit(char c) -> bool {
  return c >= '0' && c <= '9';
}

struct Token {
  std::string_view text;
  uint32_t offset = 0;  // Relative to the start of the tokenized text
};

auto Tokenize(std::string_view text) -> std::vector<Token> {
  std::vector<Token> tokens;
  size_t pos = 0;
  while (pos < text.size()) {
    while (pos < text.size() && IsBlank(text[pos])) ++pos;
    if (pos == text.size()) break;
    size_t start = pos;
    while (pos < text.size() && !IsBlank(text[pos])) ++pos;
    tokens.push_back(
        Token{
            .text = text.substr(start, pos - start),
            .offset = static_cast<uint32_t>(start),
        });
  }
  return tokens;
}

auto TokenSpan(SourceSpan base, const Token& token) -> SourceSpan {
  SourceSpan local{
      .begin = token.offset,
      .end = token.offset + static_cast<uint32_t>(token.text.size()),
  };
  return local.Shifted(base.begin);
}

auto ParseNumber(
    const Token& token, SourceSpan base, DiagCode code, std::string_view what)
    -> Result<uint64_t> {
  uint64_t value = 0;
  const char* first = token.text.data();
  const char* last = first + token.text.size();
  auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec == std::errc::result_out_of_range) {
    return std::unexpected(
        Diagnostic::Error(
            TokenSpan(base, token), code,
            fmt::format("{} '{}' does not fit in 64 bits", what, token.text)));
  }
  if (ec != std::errc{} || ptr != last) {
    return std::unexpected(
        Diagnostic::Error(
            TokenSpan(base, token), code,
            fmt::format(
                "{} '{}' is not a non-negative integer", what, token.text)));
  }
  return value;
}

auto IsValidCategory(std::string_view name) -> bool {
  if (name.empty()) return false;
  for (char c : name) {
    if (c == '-' || IsBlank(c)) return false;
  }
  return true;
}

// A section whose segment lines are still being read.
struct PendingStage {
  Stage stage;
  std::vector<mapping::Segment> segments;
  std::vector<SourceSpan> spans;  // Parallel to segments
};

class AlmanacParser {
 public:
  explicit AlmanacParser(DiagnosticSink& sink) : sink_(sink) {
  }

  // `line` excludes the '\n'; `offset` is where it starts in the text.
  void ParseLine(std::string_view line, uint32_t offset) {
    size_t lead = line.find_first_not_of(kBlanks);
    if (lead == std::string_view::npos) {
      return;
    }
    size_t last = line.find_last_not_of(kBlanks);
    std::string_view text = line.substr(lead, last - lead + 1);
    SourceSpan span = Span(
        offset + static_cast<uint32_t>(lead),
        offset + static_cast<uint32_t>(last + 1));

    if (text.starts_with(kSeedsPrefix)) {
      if (seen_seeds_) {
        sink_.Error(span, DiagCode::kMalformedSeeds, "duplicate 'seeds:' line");
      } else {
        ParseSeeds(text, span);
      }
      seen_seeds_ = true;
      return;
    }

    if (!seen_seeds_ && !reported_late_seeds_) {
      sink_.Error(
          span, DiagCode::kMalformedSeeds,
          "expected a 'seeds:' line before any stage");
      reported_late_seeds_ = true;
    }

    // Category names may start with a digit, so the suffix decides first.
    char first = text.front();
    if (!text.ends_with(kHeaderSuffix) &&
        (IsDigit(first) || first == '-' || first == '+')) {
      ParseSegment(text, span);
    } else {
      ParseHeader(text, span);
    }
  }

  auto Finish() -> std::optional<Almanac> {
    CloseStage();
    if (!seen_seeds_ && !reported_late_seeds_) {
      sink_.Error(Span(0, 0), DiagCode::kMalformedSeeds, "missing 'seeds:' line");
    }
    if (almanac_.stages.empty()) {
      sink_.Error(
          Span(0, 0), DiagCode::kEmptyAlmanac,
          "no '<source>-to-<destination> map:' sections");
    }
    if (sink_.HasErrors()) {
      return std::nullopt;
    }
    return std::move(almanac_);
  }

 private:
  static auto Span(uint32_t begin, uint32_t end) -> SourceSpan {
    return SourceSpan{.begin = begin, .end = end};
  }

  void ParseSeeds(std::string_view text, SourceSpan span) {
    std::string_view rest = text.substr(kSeedsPrefix.size());
    SourceSpan rest_span{
        .begin = span.begin + static_cast<uint32_t>(kSeedsPrefix.size()),
        .end = span.end};
    for (const auto& token : Tokenize(rest)) {
      auto value =
          ParseNumber(token, rest_span, DiagCode::kMalformedSeeds, "seed");
      if (!value) {
        sink_.Report(std::move(value.error()));
        continue;
      }
      almanac_.seeds.push_back(*value);
    }
  }

  void ParseHeader(std::string_view text, SourceSpan span) {
    CloseStage();
    skipping_ = true;

    auto malformed = [&] {
      sink_.Error(
          span, DiagCode::kMalformedHeader,
          fmt::format(
              "expected '<source>-to-<destination> map:', found '{}'", text));
    };

    if (!text.ends_with(kHeaderSuffix)) {
      malformed();
      return;
    }
    std::string_view name = text.substr(0, text.size() - kHeaderSuffix.size());
    if (name.empty() || !IsBlank(name.back())) {
      malformed();
      return;
    }
    name = name.substr(0, name.find_last_not_of(kBlanks) + 1);

    size_t sep = name.find(kCategorySeparator);
    if (sep == std::string_view::npos) {
      malformed();
      return;
    }
    std::string_view source = name.substr(0, sep);
    std::string_view destination = name.substr(sep + kCategorySeparator.size());
    if (!IsValidCategory(source) || !IsValidCategory(destination)) {
      malformed();
      return;
    }

    if (!almanac_.stages.empty()) {
      const Stage& previous = almanac_.stages.back();
      if (previous.destination_category != source) {
        sink_.Report(
            Diagnostic::Error(
                span, DiagCode::kBrokenChain,
                fmt::format(
                    "stage '{}' does not continue the chain", name))
                .WithNote(
                    previous.header_span,
                    fmt::format(
                        "previous stage maps to '{}'",
                        previous.destination_category)));
      }
    }

    auto [it, inserted] =
        source_categories_.try_emplace(std::string(source), span);
    if (!inserted) {
      sink_.Report(
          Diagnostic::Error(
              span, DiagCode::kBrokenChain,
              fmt::format("category '{}' is mapped more than once", source))
              .WithNote(it->second, "first mapped here"));
    }

    skipping_ = false;
    pending_.emplace();
    pending_->stage.source_category = std::string(source);
    pending_->stage.destination_category = std::string(destination);
    pending_->stage.header_span = span;
  }

  void ParseSegment(std::string_view text, SourceSpan span) {
    if (skipping_) {
      return;
    }
    if (!pending_) {
      sink_.Error(
          span, DiagCode::kOrphanSegment,
          "segment line before the first "
          "'<source>-to-<destination> map:' header");
      return;
    }
    auto segment = ParseSegmentLine(text, span);
    if (!segment) {
      sink_.Report(std::move(segment.error()));
      return;
    }
    pending_->segments.push_back(*segment);
    pending_->spans.push_back(span);
  }

  void CloseStage() {
    if (!pending_) {
      return;
    }
    PendingStage& pending = *pending_;
    Stage& stage = pending.stage;

    // source_start -> index of the first segment with it
    absl::flat_hash_map<uint64_t, size_t> first_by_start;
    for (size_t i = 0; i < pending.segments.size(); ++i) {
      uint64_t start = pending.segments[i].source_start;
      auto [it, inserted] = first_by_start.try_emplace(start, i);
      if (!inserted) {
        sink_.Report(
            Diagnostic::Warning(
                pending.spans[i],
                fmt::format(
                    "duplicate source start {}; this segment is ignored",
                    start))
                .WithNote(
                    pending.spans[it->second],
                    "first segment with this source start"));
      }
    }

    stage.map = mapping::StageMap(std::move(pending.segments));

    auto segments = stage.map.Segments();
    auto overlaps = stage.map.FindOverlaps();
    for (const auto& [lo, hi] : overlaps) {
      const mapping::Segment& lower = segments[lo];
      const mapping::Segment& upper = segments[hi];
      sink_.Report(
          Diagnostic::Warning(
              pending.spans[first_by_start.at(upper.source_start)],
              fmt::format(
                  "segment [{}, {}) overlaps [{}, {}); shared values map "
                  "through the segment with the lower source start",
                  upper.source_start, upper.SourceEnd(), lower.source_start,
                  lower.SourceEnd()))
              .WithNote(
                  pending.spans[first_by_start.at(lower.source_start)],
                  "overlapped segment"));
    }

    if (stage.map.IsEmpty()) {
      sink_.Warning(
          stage.header_span,
          fmt::format(
              "stage '{}-to-{}' has no segments; every value passes through "
              "unchanged",
              stage.source_category, stage.destination_category));
    }

    spdlog::debug(
        "stage {}-to-{}: {} segments, {} overlaps", stage.source_category,
        stage.destination_category, stage.map.Size(), overlaps.size());

    almanac_.stages.push_back(std::move(stage));
    pending_.reset();
  }

  DiagnosticSink& sink_;
  Almanac almanac_;
  bool seen_seeds_ = false;
  // A stage came before any seeds line and that was already reported.
  bool reported_late_seeds_ = false;
  // Set after a malformed header so its segment lines are not misattributed.
  bool skipping_ = false;
  std::optional<PendingStage> pending_;
  absl::flat_hash_map<std::string, SourceSpan> source_categories_;
};

}  // namespace

auto ParseSegmentLine(std::string_view line, SourceSpan line_span)
    -> Result<mapping::Segment> {
  auto tokens = Tokenize(line);
  if (tokens.size() != 3) {
    return std::unexpected(
        Diagnostic::Error(
            line_span, DiagCode::kMalformedSegment,
            fmt::format(
                "expected 3 numbers (destination start, source start, "
                "length), found {} token{}",
                tokens.size(), tokens.size() == 1 ? "" : "s")));
  }

  auto destination = ParseNumber(
      tokens[0], line_span, DiagCode::kMalformedSegment, "destination start");
  if (!destination) return std::unexpected(destination.error());
  auto source = ParseNumber(
      tokens[1], line_span, DiagCode::kMalformedSegment, "source start");
  if (!source) return std::unexpected(source.error());
  auto length = ParseNumber(
      tokens[2], line_span, DiagCode::kMalformedSegment, "length");
  if (!length) return std::unexpected(length.error());

  if (*length == 0) {
    return std::unexpected(
        Diagnostic::Error(
            TokenSpan(line_span, tokens[2]), DiagCode::kMalformedSegment,
            "segment length must be positive"));
  }

  return mapping::Segment{
      .source_start = *source,
      .destination_start = *destination,
      .length = *length,
  };
}

auto BuildStageMap(const std::vector<std::string>& lines)
    -> Result<mapping::StageMap> {
  std::vector<mapping::Segment> segments;
  segments.reserve(lines.size());
  for (size_t i = 0; i < lines.size(); ++i) {
    SourceSpan span{
        .begin = 0,
        .end = static_cast<uint32_t>(lines[i].size()),
    };
    auto segment = ParseSegmentLine(lines[i], span);
    if (!segment) {
      return std::unexpected(
          std::move(segment.error())
              .WithNote(fmt::format("in stage line {}: '{}'", i + 1, lines[i])));
    }
    segments.push_back(*segment);
  }
  return mapping::StageMap(std::move(segments));
}

auto ParseAlmanac(std::string_view content, DiagnosticSink& sink)
    -> std::optional<Almanac> {
  AlmanacParser parser(sink);
  size_t pos = 0;
  while (true) {
    size_t newline = content.find('\n', pos);
    size_t end = newline == std::string_view::npos ? content.size() : newline;
    parser.ParseLine(
        content.substr(pos, end - pos), static_cast<uint32_t>(pos));
    if (newline == std::string_view::npos) break;
    pos = newline + 1;
  }
  return parser.Finish();
}

}  // namespace almanac::dataset
