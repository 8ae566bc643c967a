#pragma once

#include "util/status.hpp"

#include <string>

namespace phabstack {

// Install the stderr logger as spdlog's default and set its level
// (trace, debug, info, warn, error, off).
bool
log_setup(const std::string& level, Status& status);

}  // namespace phabstack
