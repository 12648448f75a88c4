#include <argparse/argparse.hpp>
#include <exception>
#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>

#include <fmt/core.h>

#include "commands.hpp"
#include "logging.hpp"
#include "print.hpp"

namespace {

namespace fs = std::filesystem;

auto IsVerbose(
    const argparse::ArgumentParser& program,
    const argparse::ArgumentParser& cmd) -> bool {
  return program.is_subcommand_used(cmd) && cmd.get<bool>("--verbose");
}

}  // namespace

auto main(int argc, char* argv[]) -> int {
  argparse::ArgumentParser program("almanac", "0.1.0");
  program.add_description(
      "Translate identifiers through a chain of piecewise range maps");
  program.add_argument("-C").help("Run as if started in <dir>").metavar("dir");

  // Subcommand: solve
  argparse::ArgumentParser solve_cmd(
      "solve", "0.1.0", argparse::default_arguments::help);
  solve_cmd.add_description(
      "Print the minimal destination value over the seeds");
  solve_cmd.add_argument("--mode").help(
      "Query mode: scalar, range, or both (default both)");
  solve_cmd.add_argument("--stats")
      .default_value(false)
      .implicit_value(true)
      .help("Print phase timings to stderr");
  almanac::driver::AddDatasetFlags(solve_cmd);
  solve_cmd.add_argument("file").nargs(0, 1).help(
      "Almanac file (uses almanac.toml if not specified)");

  // Subcommand: translate
  argparse::ArgumentParser translate_cmd(
      "translate", "0.1.0", argparse::default_arguments::help);
  translate_cmd.add_description("Translate individual values");
  translate_cmd.add_argument("--file").help(
      "Almanac file (uses almanac.toml if not specified)");
  translate_cmd.add_argument("--trace")
      .default_value(false)
      .implicit_value(true)
      .help("Show the value in every category");
  almanac::driver::AddDatasetFlags(translate_cmd);
  translate_cmd.add_argument("values")
      .nargs(argparse::nargs_pattern::any)
      .help("Values to translate");

  // Subcommand: check
  argparse::ArgumentParser check_cmd(
      "check", "0.1.0", argparse::default_arguments::help);
  check_cmd.add_description("Validate an almanac file");
  almanac::driver::AddDatasetFlags(check_cmd);
  check_cmd.add_argument("file").nargs(0, 1).help(
      "Almanac file (uses almanac.toml if not specified)");

  program.add_subparser(solve_cmd);
  program.add_subparser(translate_cmd);
  program.add_subparser(check_cmd);

  try {
    program.parse_args(argc, argv);
  } catch (const std::exception& err) {
    almanac::driver::PrintError(err.what());
    std::cerr << program;
    return 1;
  }

  almanac::driver::InitLogging(
      IsVerbose(program, solve_cmd) || IsVerbose(program, translate_cmd) ||
      IsVerbose(program, check_cmd));

  // Handle -C before dispatching subcommands
  if (auto dir = program.present("-C")) {
    std::error_code ec;
    fs::current_path(*dir, ec);
    if (ec) {
      almanac::driver::PrintError(
          fmt::format("cannot change to '{}': {}", *dir, ec.message()));
      return 1;
    }
  }

  try {
    if (program.is_subcommand_used("solve")) {
      return almanac::driver::SolveCommand(solve_cmd);
    }
    if (program.is_subcommand_used("translate")) {
      return almanac::driver::TranslateCommand(translate_cmd);
    }
    if (program.is_subcommand_used("check")) {
      return almanac::driver::CheckCommand(check_cmd);
    }
  } catch (const std::exception& err) {
    almanac::driver::PrintError(err.what());
    return 1;
  }

  // No subcommand provided
  std::cout << program;
  return 0;
}
