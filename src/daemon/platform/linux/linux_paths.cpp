#include "platform/platform_paths.hpp"

#include <cstdlib>
#include <format>
#include <unistd.h>

namespace platform {

namespace {

// $xdg_var/voicekey, else $HOME/home_suffix/voicekey.
std::string xdg_dir(const char* xdg_var, const char* home_suffix) {
    const char* xdg = std::getenv(xdg_var);
    if (xdg && *xdg) return std::string(xdg) + "/voicekey";
    const char* home = std::getenv("HOME");
    if (!home || !*home) return {};
    return std::format("{}/{}/voicekey", home, home_suffix);
}

} // namespace

std::string config_dir() {
    return xdg_dir("XDG_CONFIG_HOME", ".config");
}

std::string data_dir() {
    return xdg_dir("XDG_DATA_HOME", ".local/share");
}

std::string ipc_endpoint() {
    const char* override_path = std::getenv("VOICEKEY_SOCKET");
    if (override_path && *override_path) return override_path;

    const char* runtime = std::getenv("XDG_RUNTIME_DIR");
    if (runtime && *runtime) return std::string(runtime) + "/voicekey.sock";

    // Shared /tmp: keep users apart.
    return std::format("/tmp/voicekey-{}.sock", ::getuid());
}

} // namespace platform
