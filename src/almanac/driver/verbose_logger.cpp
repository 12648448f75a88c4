#include "verbose_logger.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>
#include <utility>

#include <fmt/core.h>

namespace almanac::driver {

namespace {

// Format current time as HH:MM:SS
auto FormatTime() -> std::string {
  auto now = std::chrono::system_clock::now();
  auto time_t_now = std::chrono::system_clock::to_time_t(now);
  std::tm tm_buf{};
  localtime_r(&time_t_now, &tm_buf);
  std::ostringstream oss;
  oss << std::put_time(&tm_buf, "%H:%M:%S");
  return oss.str();
}

}  // namespace

void VerboseLogger::PhaseBegin(std::string_view phase_name) {
  if (!Enabled(1)) return;
  fmt::print(
      sink_, "[almanac][{}][phase] {}: begin\n", FormatTime(), phase_name);
  std::fflush(sink_);
}

void VerboseLogger::PhaseDone(std::string_view phase_name, double milliseconds) {
  if (!Enabled(1)) return;
  fmt::print(
      sink_, "[almanac][{}][phase] {}: done ({:.3f}ms)\n", FormatTime(),
      phase_name, milliseconds);
  std::fflush(sink_);
}

void VerboseLogger::RecordPhaseDuration(
    std::string_view name, double milliseconds) {
  phase_durations_[std::string(name)] = milliseconds;
}

void VerboseLogger::PrintPhaseSummary(FILE* sink) const {
  std::string line = "[almanac][stats][phase]";
  for (std::string_view phase : kPhaseOrder) {
    auto it = phase_durations_.find(std::string(phase));
    if (it != phase_durations_.end()) {
      line += fmt::format(" {}={:.3f}ms", phase, it->second);
    }
  }
  fmt::print(sink, "{}\n", line);
  std::fflush(sink);
}

PhaseTimer::PhaseTimer(VerboseLogger& logger, std::string phase_name)
    : logger_(logger),
      phase_name_(std::move(phase_name)),
      start_(std::chrono::steady_clock::now()),
      enabled_(logger.Enabled(1)) {
  if (enabled_) {
    logger_.PhaseBegin(phase_name_);
  }
}

PhaseTimer::~PhaseTimer() {
  auto end = std::chrono::steady_clock::now();
  auto duration =
      std::chrono::duration_cast<std::chrono::microseconds>(end - start_);
  double milliseconds = static_cast<double>(duration.count()) / 1000.0;

  // ALWAYS record duration (for --stats), regardless of verbosity
  logger_.RecordPhaseDuration(phase_name_, milliseconds);

  if (enabled_) {
    logger_.PhaseDone(phase_name_, milliseconds);
  }
}

}  // namespace almanac::driver
