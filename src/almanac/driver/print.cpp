#include "print.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

#include <fmt/color.h>
#include <fmt/core.h>

#include "almanac/common/diagnostic/diagnostic.hpp"
#include "almanac/common/diagnostic/diagnostic_sink.hpp"
#include "almanac/common/source_text.hpp"
#include "almanac/common/source_span.hpp"

namespace almanac::driver {

namespace {

constexpr auto kToolColor = fmt::terminal_color::white;
constexpr auto kToolStyle = fmt::fg(kToolColor) | fmt::emphasis::bold;

auto DiagKindToString(DiagKind kind) -> const char* {
  switch (kind) {
    case DiagKind::kError:
    case DiagKind::kHostError:
      return "error:";
    case DiagKind::kWarning:
      return "warning:";
    case DiagKind::kNote:
      return "note:";
  }
  return "error:";
}

auto DiagKindToStyle(DiagKind kind) -> fmt::text_style {
  switch (kind) {
    case DiagKind::kError:
    case DiagKind::kHostError:
      return fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::bold;
    case DiagKind::kWarning:
      return fmt::fg(fmt::terminal_color::bright_magenta) | fmt::emphasis::bold;
    case DiagKind::kNote:
      return fmt::fg(fmt::terminal_color::bright_cyan) | fmt::emphasis::bold;
  }
  return fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::bold;
}

// Quote the line holding the span start and underline the span, clamped to
// that line.
void PrintSourceExcerpt(const SourceSpan& span, const SourceText& source) {
  SourcePosition pos = source.PositionOf(span.begin);
  std::string_view line = source.LineAt(span.begin);

  std::string line_num_str = std::to_string(pos.line);
  size_t field_width = std::max(line_num_str.size(), size_t{4});
  std::string num_field(field_width - line_num_str.size(), ' ');
  num_field += line_num_str;
  std::string blank_field(field_width, ' ');

  constexpr auto kGutterStyle = fmt::fg(fmt::terminal_color::white);

  fmt::print(
      stderr, " {} {}\n", fmt::styled(num_field + " |", kGutterStyle), line);

  size_t col = pos.column - 1;
  size_t room = line.size() > col ? line.size() - col : 1;
  size_t width = std::clamp<size_t>(span.Length(), 1, room);

  std::string marker = "^" + std::string(width - 1, '~');
  constexpr auto kMarkerStyle = fmt::fg(fmt::terminal_color::green);

  fmt::print(
      stderr, " {} {}{}\n", fmt::styled(blank_field + " |", kGutterStyle),
      std::string(col, ' '), fmt::styled(marker, kMarkerStyle));
}

// Print a single DiagItem with optional source context
void PrintDiagItem(
    const DiagItem& item, const SourceText* source, bool is_primary) {
  const char* kind_str = DiagKindToString(item.kind);
  fmt::text_style kind_style = DiagKindToStyle(item.kind);

  const auto* span = std::get_if<SourceSpan>(&item.span);
  std::string location = (span != nullptr && source != nullptr)
                             ? source->Describe(*span)
                             : std::string("almanac");
  fmt::text_style location_style =
      (span != nullptr && source != nullptr)
          ? fmt::text_style(fmt::emphasis::bold)
          : kToolStyle;

  auto message_style = is_primary ? fmt::emphasis::bold : fmt::text_style{};
  fmt::print(
      stderr, "{}: {} {}\n", fmt::styled(location, location_style),
      fmt::styled(kind_str, kind_style),
      fmt::styled(item.message, message_style));

  // Source line and caret marker only for primary messages with a span
  if (is_primary && span != nullptr && source != nullptr) {
    PrintSourceExcerpt(*span, *source);
  }
}

}  // namespace

void PrintError(const std::string& message) {
  fmt::print(
      stderr, "{}: {} {}\n", fmt::styled("almanac", kToolStyle),
      fmt::styled(
          "error:",
          fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::bold),
      fmt::styled(message, fmt::emphasis::bold));
}

void PrintWarning(const std::string& message) {
  fmt::print(
      stderr, "{}: {} {}\n", fmt::styled("almanac", kToolStyle),
      fmt::styled(
          "warning:",
          fmt::fg(fmt::terminal_color::bright_yellow) | fmt::emphasis::bold),
      fmt::styled(message, fmt::emphasis::bold));
}

void PrintDiagnostic(const Diagnostic& diag, const SourceText* source) {
  PrintDiagItem(diag.primary, source, true);
  for (const auto& note : diag.notes) {
    PrintDiagItem(note, source, false);
  }
}

void PrintDiagnostics(const DiagnosticSink& sink, const SourceText* source) {
  uint32_t error_count = 0;
  uint32_t warning_count = 0;

  for (const auto& diag : sink.GetDiagnostics()) {
    switch (diag.primary.kind) {
      case DiagKind::kError:
      case DiagKind::kHostError:
        ++error_count;
        break;
      case DiagKind::kWarning:
        ++warning_count;
        break;
      case DiagKind::kNote:
        break;
    }
    PrintDiagnostic(diag, source);
  }

  if (warning_count > 0 || error_count > 0) {
    std::string summary;
    if (warning_count > 0) {
      summary += fmt::format(
          "{} warning{}", warning_count, warning_count == 1 ? "" : "s");
    }
    if (warning_count > 0 && error_count > 0) {
      summary += " and ";
    }
    if (error_count > 0) {
      summary +=
          fmt::format("{} error{}", error_count, error_count == 1 ? "" : "s");
    }
    fmt::print(stderr, "{} generated.\n", summary);
  }
}

}  // namespace almanac::driver
