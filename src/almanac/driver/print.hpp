#pragma once

#include <string>

#include "almanac/common/diagnostic/diagnostic.hpp"
#include "almanac/common/diagnostic/diagnostic_sink.hpp"
#include "almanac/common/source_text.hpp"

namespace almanac::driver {

void PrintError(const std::string& message);
void PrintWarning(const std::string& message);
// `source` resolves spans to "file:line:col" and a quoted line; without it
// only the messages are printed.
void PrintDiagnostic(const Diagnostic& diag, const SourceText* source = nullptr);
void PrintDiagnostics(const DiagnosticSink& sink, const SourceText* source);

}  // namespace almanac::driver
