#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "almanac/common/diagnostic/diagnostic.hpp"

namespace almanac {

// Collects diagnostics while parsing a dataset. Not thread-safe.
// Diagnostics are stored in order of reporting; callers may rely on this.
class DiagnosticSink {
 public:
  void Report(Diagnostic diag) {
    switch (diag.primary.kind) {
      case DiagKind::kError:
      case DiagKind::kHostError:
        has_errors_ = true;
        break;
      case DiagKind::kWarning:
        ++warning_count_;
        break;
      case DiagKind::kNote:
        break;
    }
    diagnostics_.push_back(std::move(diag));
  }

  void Error(SourceSpan loc, DiagCode code, std::string msg) {
    Report(Diagnostic::Error(loc, code, std::move(msg)));
  }

  void Warning(SourceSpan loc, std::string msg) {
    Report(Diagnostic::Warning(loc, std::move(msg)));
  }

  [[nodiscard]] auto HasErrors() const -> bool {
    return has_errors_;
  }

  [[nodiscard]] auto WarningCount() const -> size_t {
    return warning_count_;
  }

  [[nodiscard]] auto GetDiagnostics() const -> const std::vector<Diagnostic>& {
    return diagnostics_;
  }

  // Promote every warning reported so far to an error (--Werror).
  void PromoteWarnings() {
    for (auto& diag : diagnostics_) {
      if (diag.primary.kind == DiagKind::kWarning) {
        diag.primary.kind = DiagKind::kError;
        has_errors_ = true;
      }
    }
    warning_count_ = 0;
  }

  void Clear() {
    diagnostics_.clear();
    has_errors_ = false;
    warning_count_ = 0;
  }

 private:
  std::vector<Diagnostic> diagnostics_;
  bool has_errors_ = false;
  size_t warning_count_ = 0;
};

}  // namespace almanac
