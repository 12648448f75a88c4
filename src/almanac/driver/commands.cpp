#include "commands.hpp"

#include <optional>
#include <string>
#include <vector>

#include <argparse/argparse.hpp>

#include "config.hpp"
#include "input.hpp"
#include "print.hpp"
#include "solve.hpp"

namespace almanac::driver {

namespace {

// Config lookup, CLI merge and flag handling shared by every subcommand.
auto PrepareInput(
    const argparse::ArgumentParser& cmd,
    const std::optional<std::string>& cli_file) -> std::optional<DatasetInput> {
  auto config_result = LoadOptionalConfig();
  if (!config_result) {
    PrintDiagnostic(config_result.error());
    return std::nullopt;
  }

  auto input = BuildInput(cli_file, *config_result);
  if (!input) {
    PrintDiagnostic(input.error());
    return std::nullopt;
  }

  ApplyDatasetFlags(cmd, *input);
  return *input;
}

}  // namespace

auto SolveCommand(const argparse::ArgumentParser& cmd) -> int {
  auto input = PrepareInput(cmd, cmd.present<std::string>("file"));
  if (!input) {
    return 1;
  }

  if (auto mode = cmd.present<std::string>("--mode")) {
    auto parsed = ParseSolveMode(*mode);
    if (!parsed) {
      PrintDiagnostic(parsed.error());
      return 1;
    }
    input->mode = *parsed;
  }
  input->stats = cmd.get<bool>("--stats");

  return Solve(*input);
}

auto TranslateCommand(const argparse::ArgumentParser& cmd) -> int {
  auto input = PrepareInput(cmd, cmd.present<std::string>("--file"));
  if (!input) {
    return 1;
  }

  std::vector<std::string> values;
  if (auto vals = cmd.present<std::vector<std::string>>("values")) {
    values = *vals;
  }
  return Translate(*input, values, cmd.get<bool>("--trace"));
}

auto CheckCommand(const argparse::ArgumentParser& cmd) -> int {
  auto input = PrepareInput(cmd, cmd.present<std::string>("file"));
  if (!input) {
    return 1;
  }
  return Check(*input);
}

}  // namespace almanac::driver
