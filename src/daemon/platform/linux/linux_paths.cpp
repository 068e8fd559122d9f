#include "platform/platform_paths.hpp"

#include <cstdlib>

namespace platform {

std::string config_dir() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg) return std::string(xdg) + "/live-scribe";
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + "/.config/live-scribe";
}

std::string data_dir() {
    const char* xdg = std::getenv("XDG_DATA_HOME");
    if (xdg) return std::string(xdg) + "/live-scribe";
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + "/.local/share/live-scribe";
}

std::string log_path() {
    auto dir = data_dir();
    if (dir.empty()) return {};
    return dir + "/live-scribed.log";
}

std::string ipc_endpoint() {
    const char* override_path = std::getenv("LIVE_SCRIBE_SOCKET");
    if (override_path && *override_path) return override_path;
    const char* xdg = std::getenv("XDG_RUNTIME_DIR");
    if (xdg) return std::string(xdg) + "/live-scribe.sock";
    return "/tmp/live-scribe.sock";
}

} // namespace platform
