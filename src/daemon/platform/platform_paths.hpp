#pragma once

#include <string>

namespace platform {

// Per-user config directory, empty if it cannot be determined.
std::string config_dir();
// Per-user data directory (history database, daemon log).
std::string data_dir();
// Where the daemon listens for client commands. VOICEKEY_SOCKET overrides.
std::string ipc_endpoint();

} // namespace platform
