#pragma once

#include <string>

namespace platform {

// Detach from the terminal and continue in the background. stderr is
// appended to log_path so verbose logging survives; /dev/null if empty.
void daemonize(const std::string& log_path);

} // namespace platform
