#include "config.hpp"

#include <expected>
#include <filesystem>
#include <optional>
#include <string>

#include <fmt/core.h>
#include <toml++/toml.hpp>

#include "almanac/common/diagnostic/diagnostic.hpp"

namespace almanac::driver {

namespace fs = std::filesystem;

auto ParseSolveMode(const std::string& s) -> Result<SolveMode> {
  if (s == "scalar") return SolveMode::kScalar;
  if (s == "range") return SolveMode::kRange;
  if (s == "both") return SolveMode::kBoth;
  return std::unexpected(
      Diagnostic::HostError(
          "unknown mode '" + s + "', use 'scalar', 'range', or 'both'"));
}

auto FindConfig(const fs::path& start_dir) -> std::optional<fs::path> {
  fs::path dir = fs::absolute(start_dir);

  while (true) {
    fs::path config_path = dir / kConfigFileName;
    if (fs::exists(config_path)) {
      return config_path;
    }

    fs::path parent = dir.parent_path();
    if (parent == dir) {
      // Reached root
      return std::nullopt;
    }
    dir = parent;
  }
}

auto LoadConfig(const fs::path& config_path) -> Result<ProjectConfig> {
  ProjectConfig config;
  config.root_dir = config_path.parent_path();

  toml::table tbl;
  try {
    tbl = toml::parse_file(config_path.string());
  } catch (const toml::parse_error& e) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format(
                "failed to parse {}: {}", config_path.string(),
                e.description())));
  }

  // [dataset] section
  auto dataset = tbl["dataset"];
  if (!dataset) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format(
                "{}: missing [dataset] section", config_path.string())));
  }

  auto file = dataset["file"].value<std::string>();
  if (!file) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format(
                "{}: missing required field 'dataset.file'",
                config_path.string())));
  }
  fs::path file_path = *file;
  if (file_path.is_relative()) {
    file_path = config.root_dir / file_path;
  }
  if (!fs::exists(file_path)) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format(
                "dataset file not found: {} (listed in {})", *file,
                kConfigFileName)));
  }
  config.dataset_file = file_path.string();

  // [solve] section (optional)
  if (auto solve = tbl["solve"]) {
    if (auto mode = solve["mode"].value<std::string>()) {
      auto parsed = ParseSolveMode(*mode);
      if (!parsed) {
        return std::unexpected(
            Diagnostic::HostError(
                fmt::format(
                    "{}: {}", config_path.string(),
                    parsed.error().primary.message)));
      }
      config.mode = *parsed;
    }
  }

  // [diagnostics] section (optional)
  if (auto diagnostics = tbl["diagnostics"]) {
    if (auto werror = diagnostics["warnings_as_errors"].value<bool>()) {
      config.warnings_as_errors = *werror;
    }
  }

  return config;
}

}  // namespace almanac::driver
