#pragma once

#include <argparse/argparse.hpp>
#include <optional>
#include <string>

#include "almanac/common/diagnostic/diagnostic.hpp"
#include "config.hpp"

namespace almanac::driver {

struct DatasetInput {
  std::string file;
  SolveMode mode = SolveMode::kBoth;
  bool warnings_as_errors = false;
  int verbose = 0;  // Verbosity level (0-1)
  bool stats = false;
};

// Add -v and --Werror to a subcommand.
void AddDatasetFlags(argparse::ArgumentParser& cmd);

// Load almanac.toml if one is found above the working directory.
auto LoadOptionalConfig() -> Result<std::optional<ProjectConfig>>;

// Merge the dataset path from the command line with the optional config.
// CLI values override config values. Fails if neither names a file.
auto BuildInput(
    const std::optional<std::string>& cli_file,
    const std::optional<ProjectConfig>& config) -> Result<DatasetInput>;

// Apply the flags added by AddDatasetFlags.
void ApplyDatasetFlags(const argparse::ArgumentParser& cmd, DatasetInput& input);

}  // namespace almanac::driver
