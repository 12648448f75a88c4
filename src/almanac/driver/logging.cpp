#include "logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace almanac::driver {

void InitLogging(bool verbose) {
  // Results go to stdout, so the library logger must not.
  auto logger = spdlog::get("almanac");
  if (!logger) {
    logger = spdlog::stderr_color_mt("almanac");
  }
  logger->set_pattern("[almanac][%H:%M:%S][%l] %v");
  spdlog::set_default_logger(logger);
  spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::warn);
}

}  // namespace almanac::driver
