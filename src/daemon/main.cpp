#include "config.hpp"
#include "platform/daemonizer.hpp"
#include "platform/linux/linux_event_loop.hpp"
#include "platform/platform_paths.hpp"

#include <curl/curl.h>
#include <print>
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
            if (i + 1 < argc) config_path = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            std::println("Usage: live-scribed [options]");
            std::println("Options:");
            std::println("  -f, --foreground    Run in foreground (don't daemonize)");
            std::println("  -v, --verbose       Enable verbose logging");
            std::println("  -c, --config PATH   Config file path");
            std::println("  -h, --help          Show this help");
            return 0;
        }
    }

    // Load config
    Config config;
    if (!config_path.empty()) {
        config = Config::load(config_path);
    } else {
        config = Config::load_default();
    }

    if (!foreground) {
        platform::daemonize(platform::log_path());
    }

    if (verbose && foreground) {
        std::println(stderr, "[live-scribe] Starting (provider: {}, {} Hz)",
                     config.provider.type, config.audio.sample_rate);
    }

    // Once per process, before any provider thread exists.
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        std::println(stderr, "curl_global_init failed");
        return 1;
    }

    int rc = 0;
    {
        LinuxEventLoop loop(std::move(config), verbose);
        if (loop.init()) {
            loop.run();
        } else {
            std::println(stderr, "Failed to initialize event loop");
            rc = 1;
        }
    }

    curl_global_cleanup();
    return rc;
}
