#include "platform/daemonizer.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <print>
#include <sys/stat.h>
#include <unistd.h>

namespace platform {

void daemonize(const std::string& log_path) {
    // Create the log directory while errors can still reach the terminal.
    if (!log_path.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(std::filesystem::path(log_path).parent_path(), ec);
        if (ec) {
            std::println(stderr, "cannot create log directory for {}: {}", log_path, ec.message());
        }
    }

    pid_t pid = fork();
    if (pid < 0) {
        std::println(stderr, "fork() failed: {}", std::strerror(errno));
        _exit(1);
    }
    if (pid > 0) _exit(0);

    setsid();

    pid = fork();
    if (pid < 0) _exit(1);
    if (pid > 0) _exit(0);

    umask(077);
    if (chdir("/") < 0) _exit(1);

    freopen("/dev/null", "r", stdin);
    freopen("/dev/null", "w", stdout);
    if (log_path.empty() || !freopen(log_path.c_str(), "a", stderr)) {
        freopen("/dev/null", "w", stderr);
    } else {
        setvbuf(stderr, nullptr, _IOLBF, 0);
    }
}

} // namespace platform
