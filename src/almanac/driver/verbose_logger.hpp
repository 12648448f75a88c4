#pragma once

#include <array>
#include <chrono>
#include <cstdio>
#include <string>
#include <string_view>
#include <unordered_map>

namespace almanac::driver {

// Central logger for phase progress and timing.
// All output goes to stderr to preserve stdout for results.
class VerboseLogger {
 public:
  explicit VerboseLogger(int level, FILE* sink = stderr)
      : level_(level), sink_(sink) {
  }

  // Check if logging at the given level is enabled.
  auto Enabled(int required_level) const -> bool {
    return level_ >= required_level;
  }

  // Log a phase begin event (level 1).
  void PhaseBegin(std::string_view phase_name);

  // Log a phase done event with duration (level 1).
  void PhaseDone(std::string_view phase_name, double milliseconds);

  // Record phase duration (always, regardless of verbosity level).
  // Called by PhaseTimer destructor.
  void RecordPhaseDuration(std::string_view name, double milliseconds);

  // Print phase summary line for --stats output.
  void PrintPhaseSummary(FILE* sink = stderr) const;

  auto level() const -> int {
    return level_;
  }

 private:
  // Fixed phase order for deterministic output.
  static constexpr std::array<std::string_view, 4> kPhaseOrder = {
      "load", "scalar", "range", "translate"};

  int level_;
  FILE* sink_;
  std::unordered_map<std::string, double> phase_durations_;
};

// RAII helper for timing phases. Logs begin on construction, done on
// destruction.
class PhaseTimer {
 public:
  PhaseTimer(VerboseLogger& logger, std::string phase_name);
  ~PhaseTimer();

  PhaseTimer(const PhaseTimer&) = delete;
  PhaseTimer& operator=(const PhaseTimer&) = delete;
  PhaseTimer(PhaseTimer&&) = delete;
  PhaseTimer& operator=(PhaseTimer&&) = delete;

 private:
  VerboseLogger& logger_;
  std::string phase_name_;
  std::chrono::steady_clock::time_point start_;
  bool enabled_;
};

}  // namespace almanac::driver
