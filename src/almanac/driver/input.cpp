#include "input.hpp"

#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>

#include <argparse/argparse.hpp>
#include <spdlog/spdlog.h>

#include "almanac/common/diagnostic/diagnostic.hpp"
#include "config.hpp"

namespace almanac::driver {

void AddDatasetFlags(argparse::ArgumentParser& cmd) {
  cmd.add_argument("-v", "--verbose")
      .default_value(false)
      .implicit_value(true)
      .help("Log phases and stage statistics to stderr");
  cmd.add_argument("--Werror")
      .default_value(false)
      .implicit_value(true)
      .help("Treat dataset warnings as errors");
}

auto LoadOptionalConfig() -> Result<std::optional<ProjectConfig>> {
  auto config_path = FindConfig();
  if (!config_path) {
    return std::optional<ProjectConfig>{};
  }
  spdlog::debug("using {}", config_path->string());
  auto config = LoadConfig(*config_path);
  if (!config) {
    return std::unexpected(config.error());
  }
  return std::optional<ProjectConfig>(std::move(*config));
}

auto BuildInput(
    const std::optional<std::string>& cli_file,
    const std::optional<ProjectConfig>& config) -> Result<DatasetInput> {
  DatasetInput input;

  // File: CLI replaces config
  if (cli_file) {
    input.file = *cli_file;
  } else if (config) {
    input.file = config->dataset_file;
  }
  if (input.file.empty()) {
    return std::unexpected(
        Diagnostic::HostError(
            "no input file (pass one or create almanac.toml)"));
  }

  if (config) {
    if (config->mode) {
      input.mode = *config->mode;
    }
    input.warnings_as_errors = config->warnings_as_errors;
  }

  return input;
}

void ApplyDatasetFlags(const argparse::ArgumentParser& cmd, DatasetInput& input) {
  if (cmd.get<bool>("--verbose")) {
    input.verbose = 1;
  }
  if (cmd.get<bool>("--Werror")) {
    input.warnings_as_errors = true;
  }
}

}  // namespace almanac::driver
