#pragma once

#include <cstdint>
#include <exception>
#include <expected>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "almanac/common/source_span.hpp"

namespace almanac {

// Type of diagnostic message
enum class DiagKind : uint8_t {
  kError,      // Malformed almanac data or query
  kHostError,  // I/O, configuration, command line
  kWarning,    // Non-fatal
  kNote,       // Auxiliary message
};

// What went wrong, for errors that callers need to tell apart.
enum class DiagCode : uint8_t {
  kMalformedSeeds,    // "seeds:" line missing or not numeric
  kMalformedHeader,   // Section header is not "<a>-to-<b> map:"
  kMalformedSegment,  // Segment line is not three non-negative integers
  kOrphanSegment,     // Segment line before the first section header
  kBrokenChain,       // Stage categories do not chain
  kEmptyAlmanac,      // No stage at all
  kUnpairedSeed,      // Range mode with an odd seed count
  kEmptyQuery,        // Nothing to take a minimum over
};

// Represents missing source span (for host errors or when span unavailable)
struct UnknownSpan {
  auto operator==(const UnknownSpan&) const -> bool = default;
};

// A diagnostic span: either a resolved SourceSpan or UnknownSpan
using DiagSpan = std::variant<SourceSpan, UnknownSpan>;

// Single diagnostic item (primary or note)
struct DiagItem {
  DiagKind kind;
  DiagSpan span;
  std::string message;
  std::optional<DiagCode> code;  // Only set for kError

  auto operator==(const DiagItem&) const -> bool = default;
};

// Complete diagnostic with primary message and optional notes
struct Diagnostic {
  DiagItem primary;
  std::vector<DiagItem> notes;

  auto operator==(const Diagnostic&) const -> bool = default;

  [[nodiscard]] auto Code() const -> std::optional<DiagCode> {
    return primary.code;
  }

  // Factory: malformed input at a known location
  static auto Error(SourceSpan span, DiagCode code, std::string msg)
      -> Diagnostic {
    return Diagnostic{
        .primary =
            {.kind = DiagKind::kError,
             .span = span,
             .message = std::move(msg),
             .code = code},
        .notes = {},
    };
  }

  // Factory: malformed input without a location (e.g., query values)
  static auto Error(DiagCode code, std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary =
            {.kind = DiagKind::kError,
             .span = UnknownSpan{},
             .message = std::move(msg),
             .code = code},
        .notes = {},
    };
  }

  // Factory: host error without source location
  static auto HostError(std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary =
            {.kind = DiagKind::kHostError,
             .span = UnknownSpan{},
             .message = std::move(msg),
             .code = std::nullopt},
        .notes = {},
    };
  }

  // Factory: warning
  static auto Warning(SourceSpan span, std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary =
            {.kind = DiagKind::kWarning,
             .span = span,
             .message = std::move(msg),
             .code = std::nullopt},
        .notes = {},
    };
  }

  // Add a note with source location
  auto WithNote(SourceSpan span, std::string msg) && -> Diagnostic {
    notes.push_back(
        DiagItem{
            .kind = DiagKind::kNote,
            .span = span,
            .message = std::move(msg),
            .code = std::nullopt,
        });
    return std::move(*this);
  }

  // Add a note without source location
  auto WithNote(std::string msg) && -> Diagnostic {
    notes.push_back(
        DiagItem{
            .kind = DiagKind::kNote,
            .span = UnknownSpan{},
            .message = std::move(msg),
            .code = std::nullopt,
        });
    return std::move(*this);
  }
};

template <typename T>
using Result = std::expected<T, Diagnostic>;

}  // namespace almanac
