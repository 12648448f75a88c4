#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "almanac/common/diagnostic/diagnostic.hpp"

namespace almanac::driver {

inline constexpr const char* kConfigFileName = "almanac.toml";

// Which query modes `solve` runs.
enum class SolveMode { kScalar, kRange, kBoth };

auto ParseSolveMode(const std::string& s) -> Result<SolveMode>;

struct ProjectConfig {
  std::string dataset_file;  // Resolved against root_dir
  std::optional<SolveMode> mode;
  bool warnings_as_errors = false;

  // Directory where almanac.toml was found
  std::filesystem::path root_dir;
};

// Search for almanac.toml starting from dir, going up to parent dirs.
// Returns nullopt if not found.
auto FindConfig(
    const std::filesystem::path& start_dir = std::filesystem::current_path())
    -> std::optional<std::filesystem::path>;

// Parse almanac.toml.
// Returns error Diagnostic on parse errors or missing required fields.
auto LoadConfig(const std::filesystem::path& config_path)
    -> Result<ProjectConfig>;

}  // namespace almanac::driver
