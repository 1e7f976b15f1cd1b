#pragma once

#include <string>

namespace platform {

// Directory holding config.json, empty if it cannot be determined.
std::string config_dir();

// Default directory for screenshots taken without an explicit path.
std::string capture_dir();

} // namespace platform
