#pragma once

namespace almanac::driver {

// Install the stderr logger used by library code (spdlog default logger).
// Level is warn unless `verbose`, then debug.
void InitLogging(bool verbose);

}  // namespace almanac::driver
