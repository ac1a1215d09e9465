#include "config.hpp"
#include "platform/daemonizer.hpp"
#include "platform/linux/linux_event_loop.hpp"
#include "platform/platform_paths.hpp"

#include <print>
#include <signal.h>
#include <string>

int main(int argc, char* argv[]) {
    bool foreground = false;
    bool verbose = false;
    std::string config_path;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--foreground" || arg == "-f") {
            foreground = true;
        } else if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 >= argc) {
                std::println(stderr, "{} requires a path", arg);
                return 2;
            }
            config_path = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            std::println("Usage: voicekeyd [options]");
            std::println("Options:");
            std::println("  -f, --foreground    Run in foreground (don't daemonize)");
            std::println("  -v, --verbose       Enable verbose logging");
            std::println("  -c, --config PATH   Config file path");
            std::println("  -h, --help          Show this help");
            return 0;
        } else {
            std::println(stderr, "Unknown option: {} (try --help)", arg);
            return 2;
        }
    }

    Config config = config_path.empty() ? Config::load_default() : Config::load(config_path);

    // Helpers (wl-copy, wtype) may exit before reading their stdin.
    signal(SIGPIPE, SIG_IGN);

    if (!foreground) {
        auto data = platform::data_dir();
        platform::daemonize(verbose && !data.empty() ? data + "/voicekeyd.log" : std::string{});
    }

    if (verbose) {
        std::println(stderr, "[voicekey] Starting (backend: {}, model: {})",
                     config.backend.url, config.backend.model);
    }

    LinuxEventLoop loop(std::move(config), verbose);
    if (!loop.init()) {
        std::println(stderr, "Failed to initialize event loop");
        return 1;
    }

    loop.run();
    return 0;
}
