#pragma once

#include "capture_session.hpp"
#include "config.hpp"
#include "platform/audio_capture.hpp"
#include "platform/ipc_server.hpp"
#include "stt/provider_registry.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

class DaemonCore {
public:
    using NotifyCallback = std::function<void()>;

    DaemonCore(Config config, bool verbose,
               ProviderRegistry& registry, AudioCapture& audio, IpcServer& ipc,
               NotifyCallback notify,
               CaptureSession::Clock clock = std::chrono::steady_clock::now);
    ~DaemonCore();

    DaemonCore(const DaemonCore&) = delete;
    DaemonCore& operator=(const DaemonCore&) = delete;

    bool init();

    nlohmann::json handle_command(const std::string& cmd_str, const nlohmann::json& cmd);

    // Sends queued session events to subscribers. Called on the loop thread
    // after notify fires.
    void flush_events();
    // Once per second while recording.
    void tick();

    void add_subscriber(int fd);
    void remove_subscriber(int fd);
    size_t subscriber_count() const { return subscribers_.size(); }

    SessionState session_state() const;
    ProviderType active_provider() const { return active_type_; }

    void shutdown();

private:
    nlohmann::json handle_start(const nlohmann::json& cmd);
    nlohmann::json handle_pause(const nlohmann::json& cmd);
    nlohmann::json handle_resume(const nlohmann::json& cmd);
    nlohmann::json handle_stop(const nlohmann::json& cmd);
    nlohmann::json handle_reset(const nlohmann::json& cmd);
    nlohmann::json handle_status(const nlohmann::json& cmd);
    nlohmann::json handle_transcript(const nlohmann::json& cmd);
    nlohmann::json handle_provider(const nlohmann::json& cmd);
    nlohmann::json handle_cleanup(const nlohmann::json& cmd);

    void new_session();
    bool session_active() const;
    void queue_event(nlohmann::json event);
    void broadcast(const nlohmann::json& event);

    static nlohmann::json error_response(const Error& error);
    static nlohmann::json error_response(ErrorKind kind, const std::string& message);

    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    ProviderRegistry& registry_;
    AudioCapture& audio_;
    IpcServer& ipc_;
    NotifyCallback notify_;
    CaptureSession::Clock clock_;

    ProviderType active_type_ = ProviderType::Deepgram;
    std::unique_ptr<CaptureSession> session_;
    std::vector<int> subscribers_;

    // Filled from provider threads, drained on the loop thread.
    std::mutex events_mutex_;
    std::vector<nlohmann::json> pending_events_;
    std::optional<ProviderType> fatal_provider_;
};
