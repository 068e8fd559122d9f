#include "platform/linux/unix_socket_client.hpp"
#include "platform/platform_paths.hpp"

#include <cstdio>
#include <format>
#include <nlohmann/json.hpp>
#include <print>
#include <string>

using json = nlohmann::json;

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} <command> [options]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  start [--provider NAME]              Start a transcription session");
    std::println(stderr, "  pause                                Pause recording");
    std::println(stderr, "  resume                               Resume recording");
    std::println(stderr, "  stop                                 Stop and print the transcript");
    std::println(stderr, "  reset                                Abandon the session");
    std::println(stderr, "  status                               Show daemon status");
    std::println(stderr, "  transcript                           Print the current transcript");
    std::println(stderr, "  listen                               Follow live transcript events");
    std::println(stderr, "  provider NAME [--credential KEY]     Select backend / set API key");
    std::println(stderr, "  cleanup [NAME]                       Release cached backend connections");
    std::println(stderr, "Providers: local, deepgram, assemblyai, realtimestt");
}

static std::string format_elapsed(uint64_t seconds) {
    return std::format("{:02}:{:02}", seconds / 60, seconds % 60);
}

// Prints subscription events until the session ends. Committed text goes
// out line by line; interim text is redrawn in place.
static int listen(UnixSocketClient& client) {
    std::string printed;
    bool line_dirty = false;

    auto clear_line = [&] {
        if (line_dirty) std::print("\r\033[K");
        line_dirty = false;
    };

    while (true) {
        json event;
        if (!client.recv(event, -1)) {
            clear_line();
            std::println(stderr, "Connection to daemon closed");
            return 1;
        }

        auto type = event.value("event", "");
        if (type == "transcript") {
            auto final_text = event.value("final", "");
            auto interim = event.value("interim", "");

            clear_line();
            if (final_text.size() > printed.size() && final_text.starts_with(printed)) {
                std::println("{}", final_text.substr(printed.size()));
                printed = final_text;
            }
            if (!interim.empty()) {
                std::print("... {}", interim);
                line_dirty = true;
            }
        } else if (type == "elapsed") {
            if (!line_dirty) {
                std::print("{}", format_elapsed(event.value("seconds", uint64_t{0})));
                line_dirty = true;
            }
        } else if (type == "state") {
            clear_line();
            auto state = event.value("state", "");
            std::println("[{}]", state);
            if (state == "stopped" || state == "idle") {
                return 0;
            }
        } else if (type == "notice") {
            clear_line();
            std::println(stderr, "{}: {} ({})", event.value("severity", ""),
                         event.value("message", ""), event.value("kind", ""));
        }
        std::fflush(stdout);
    }
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    std::string provider;
    std::string credential;
    std::string positional;

    // Parse optional args
    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--provider" && i + 1 < argc) {
            provider = argv[++i];
        } else if (arg == "--credential" && i + 1 < argc) {
            credential = argv[++i];
        } else if (positional.empty()) {
            positional = arg;
        }
    }

    // Build command JSON
    json cmd;
    if (command == "start") {
        cmd = {{"cmd", "start"}};
        if (!provider.empty()) cmd["provider"] = provider;
    } else if (command == "pause" || command == "resume" || command == "stop" ||
               command == "reset" || command == "status" || command == "transcript") {
        cmd = {{"cmd", command}};
    } else if (command == "listen") {
        cmd = {{"cmd", "subscribe"}};
    } else if (command == "provider") {
        if (positional.empty()) {
            std::println(stderr, "provider: missing NAME");
            usage(argv[0]);
            return 1;
        }
        cmd = {{"cmd", "provider"}, {"name", positional}};
        if (!credential.empty()) cmd["credential"] = credential;
    } else if (command == "cleanup") {
        cmd = {{"cmd", "cleanup"}};
        if (!positional.empty()) cmd["type"] = positional;
    } else {
        std::println(stderr, "Unknown command: {}", command);
        usage(argv[0]);
        return 1;
    }

    // Connect and send
    UnixSocketClient client;
    auto sock_path = platform::ipc_endpoint();

    if (!client.connect(sock_path)) {
        std::println(stderr, "Failed to connect to daemon at {}", sock_path);
        std::println(stderr, "Is live-scribed running?");
        return 1;
    }

    json response;
    if (!client.request(cmd, response)) {
        std::println(stderr, "No response from daemon");
        return 1;
    }

    // Display response
    auto status = response.value("status", "");

    if (status == "error") {
        std::println(stderr, "Error: {}", response.value("message", "unknown error"));
        return 1;
    }

    if (command == "listen") {
        return listen(client);
    } else if (command == "status") {
        std::println("State: {}", response.value("state", "unknown"));
        std::println("Provider: {}{}", response.value("provider", ""),
                     response.value("available", true) ? "" : " (not available)");
        std::println("Elapsed: {}", format_elapsed(response.value("elapsed", uint64_t{0})));
        if (response.value("degraded", false)) {
            std::println("Backend degraded: not transcribing");
        }
        if (auto dropped = response.value("dropped_samples", uint64_t{0}); dropped > 0) {
            std::println("Dropped audio: {} samples", dropped);
        }
    } else if (command == "transcript") {
        std::println("{}", response.value("final", ""));
        auto interim = response.value("interim", "");
        if (!interim.empty()) std::println("... {}", interim);
    } else if (command == "stop") {
        std::println("{}", response.value("text", ""));
        std::println(stderr, "({})", format_elapsed(response.value("elapsed", uint64_t{0})));
    } else if (command == "provider") {
        std::println("Provider: {} (credential {})", response.value("provider", ""),
                     response.value("credential", ""));
        if (response.contains("message")) {
            std::println("{}", response["message"].get<std::string>());
        }
    } else if (status == "ok") {
        std::println("OK");
    } else {
        std::println("{}", response.dump(2));
    }

    return 0;
}
