#pragma once

#include <argparse/argparse.hpp>

namespace almanac::driver {

auto SolveCommand(const argparse::ArgumentParser& cmd) -> int;
auto TranslateCommand(const argparse::ArgumentParser& cmd) -> int;
auto CheckCommand(const argparse::ArgumentParser& cmd) -> int;

}  // namespace almanac::driver
