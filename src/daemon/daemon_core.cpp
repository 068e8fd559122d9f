#include "daemon_core.hpp"

#include <algorithm>
#include <format>
#include <print>

DaemonCore::DaemonCore(Config config, bool verbose,
                       ProviderRegistry& registry, AudioCapture& audio, IpcServer& ipc,
                       NotifyCallback notify, CaptureSession::Clock clock)
    : config_(std::move(config)), verbose_(verbose),
      registry_(registry), audio_(audio), ipc_(ipc),
      notify_(std::move(notify)), clock_(std::move(clock)) {}

DaemonCore::~DaemonCore() = default;

bool DaemonCore::init() {
    auto type = parse_provider_type(config_.provider.type);
    if (!type) {
        std::println(stderr, "Unknown provider type: {}", config_.provider.type);
        return false;
    }
    active_type_ = *type;

    if (!registry_.has_constructor(active_type_)) {
        std::println(stderr, "Warning: provider '{}' is not available in this build",
                     config_.provider.type);
    }

    auto pc = config_.provider_config(active_type_);
    log(std::format("Provider: {} (credential {})", provider_type_name(active_type_),
                    credential_fingerprint(pc.credential)));
    return true;
}

nlohmann::json DaemonCore::handle_command(const std::string& cmd_str,
                                          const nlohmann::json& cmd) {
    if (cmd_str == "start") return handle_start(cmd);
    if (cmd_str == "pause") return handle_pause(cmd);
    if (cmd_str == "resume") return handle_resume(cmd);
    if (cmd_str == "stop") return handle_stop(cmd);
    if (cmd_str == "reset") return handle_reset(cmd);
    if (cmd_str == "status") return handle_status(cmd);
    if (cmd_str == "transcript") return handle_transcript(cmd);
    if (cmd_str == "subscribe") return {{"status", "ok"}, {"message", "subscribed"}};
    if (cmd_str == "provider") return handle_provider(cmd);
    if (cmd_str == "cleanup") return handle_cleanup(cmd);
    return {{"status", "error"}, {"message", "unknown command"}};
}

nlohmann::json DaemonCore::handle_start(const nlohmann::json& cmd) {
    if (session_active()) {
        return error_response(ErrorKind::InvalidState, "already recording");
    }

    if (cmd.contains("provider")) {
        auto name = cmd["provider"].is_string() ? cmd["provider"].get<std::string>() : "";
        auto type = parse_provider_type(name);
        if (!type) {
            return error_response(ErrorKind::UnsupportedProvider, "unknown provider: " + name);
        }
        active_type_ = *type;
    }

    // A provider that just failed fatally must be torn down before the
    // registry could hand it to the new session.
    flush_events();

    new_session();
    if (auto res = session_->start(); !res) {
        log("Start failed: " + res.error().message);
        return error_response(res.error());
    }

    log(std::format("Recording started ({})", provider_type_name(active_type_)));
    return {{"status", "ok"},
            {"state", "recording"},
            {"provider", provider_type_name(active_type_)}};
}

nlohmann::json DaemonCore::handle_pause(const nlohmann::json& /*cmd*/) {
    if (!session_) {
        return error_response(ErrorKind::InvalidState, "no active session");
    }
    if (auto res = session_->pause(); !res) {
        return error_response(res.error());
    }
    log(std::format("Paused at {}s", session_->elapsed_seconds()));
    return {{"status", "ok"}, {"state", "paused"}, {"elapsed", session_->elapsed_seconds()}};
}

nlohmann::json DaemonCore::handle_resume(const nlohmann::json& /*cmd*/) {
    if (!session_) {
        return error_response(ErrorKind::InvalidState, "no active session");
    }
    if (auto res = session_->resume(); !res) {
        return error_response(res.error());
    }
    log("Resumed");
    return {{"status", "ok"}, {"state", "recording"}};
}

nlohmann::json DaemonCore::handle_stop(const nlohmann::json& /*cmd*/) {
    if (!session_ || !session_->stop()) {
        return error_response(ErrorKind::InvalidState, "not recording");
    }

    auto text = session_->final_text();
    auto elapsed = session_->elapsed_seconds();
    log(std::format("Recording stopped, {}s, {} chars", elapsed, text.size()));

    return {{"status", "ok"}, {"state", "stopped"}, {"text", text}, {"elapsed", elapsed}};
}

nlohmann::json DaemonCore::handle_reset(const nlohmann::json& /*cmd*/) {
    if (session_) {
        auto type = session_->provider_type();
        session_->reset();
        registry_.cleanup(type);
        log("Session reset");
    }
    return {{"status", "ok"}, {"state", "idle"}};
}

nlohmann::json DaemonCore::handle_status(const nlohmann::json& /*cmd*/) {
    nlohmann::json resp = {
        {"status", "ok"},
        {"provider", provider_type_name(active_type_)},
        {"available", registry_.has_constructor(active_type_)},
    };

    if (!session_) {
        resp["state"] = "idle";
        resp["elapsed"] = 0;
        resp["degraded"] = false;
        resp["dropped_samples"] = 0;
        return resp;
    }

    resp["state"] = session_state_name(session_->state());
    resp["elapsed"] = session_->elapsed_seconds();
    resp["degraded"] = session_->degraded();
    resp["dropped_samples"] = session_->dropped_samples();
    return resp;
}

nlohmann::json DaemonCore::handle_transcript(const nlohmann::json& /*cmd*/) {
    if (!session_) {
        return {{"status", "ok"}, {"final", ""}, {"interim", ""}};
    }
    return {{"status", "ok"},
            {"final", session_->final_text()},
            {"interim", session_->interim_text()}};
}

nlohmann::json DaemonCore::handle_provider(const nlohmann::json& cmd) {
    auto name = cmd.contains("name") && cmd["name"].is_string()
        ? cmd["name"].get<std::string>() : std::string(provider_type_name(active_type_));
    auto type = parse_provider_type(name);
    if (!type) {
        return error_response(ErrorKind::UnsupportedProvider, "unknown provider: " + name);
    }
    if (!registry_.has_constructor(*type)) {
        return error_response(ErrorKind::UnsupportedProvider,
                              "provider not available in this build: " + name);
    }

    if (cmd.contains("credential") && cmd["credential"].is_string()) {
        config_.set_credential(*type, cmd["credential"].get<std::string>());
    }
    active_type_ = *type;
    config_.provider.type = name;

    auto fingerprint = credential_fingerprint(config_.provider_config(*type).credential);
    log(std::format("Provider set to {} (credential {})", name, fingerprint));

    nlohmann::json resp = {{"status", "ok"}, {"provider", name}, {"credential", fingerprint}};
    if (session_active()) {
        resp["message"] = "takes effect for the next session";
    }
    return resp;
}

nlohmann::json DaemonCore::handle_cleanup(const nlohmann::json& cmd) {
    std::optional<ProviderType> type;
    if (cmd.contains("type") && cmd["type"].is_string()) {
        auto name = cmd["type"].get<std::string>();
        type = parse_provider_type(name);
        if (!type) {
            return error_response(ErrorKind::UnsupportedProvider, "unknown provider: " + name);
        }
    }

    if (session_active() && (!type || *type == session_->provider_type())) {
        return error_response(ErrorKind::InvalidState, "provider is in use by the active session");
    }

    registry_.cleanup(type);
    log(type ? std::format("Cleaned up {}", provider_type_name(*type))
             : std::string("Cleaned up all providers"));
    return {{"status", "ok"}, {"cached", registry_.size()}};
}

void DaemonCore::new_session() {
    session_ = std::make_unique<CaptureSession>(
        registry_, audio_, config_.provider_config(active_type_), clock_);

    session_->on_state_change([this](SessionState state) {
        queue_event({{"event", "state"}, {"state", session_state_name(state)}});
    });
    session_->on_transcript_update([this](const std::string& final_text,
                                          const std::string& interim_text) {
        queue_event({{"event", "transcript"}, {"final", final_text}, {"interim", interim_text}});
    });
    session_->on_notice([this, type = active_type_](const BackendNotice& notice) {
        if (notice.severity == BackendNotice::Severity::Fatal) {
            std::lock_guard lock(events_mutex_);
            fatal_provider_ = type;
        }
        queue_event({{"event", "notice"},
                     {"severity", severity_name(notice.severity)},
                     {"kind", error_kind_name(notice.error.kind)},
                     {"message", notice.error.message}});
    });
}

bool DaemonCore::session_active() const {
    if (!session_) return false;
    auto state = session_->state();
    return state == SessionState::Recording || state == SessionState::Paused;
}

void DaemonCore::queue_event(nlohmann::json event) {
    {
        std::lock_guard lock(events_mutex_);
        pending_events_.push_back(std::move(event));
    }
    if (notify_) notify_();
}

void DaemonCore::flush_events() {
    std::vector<nlohmann::json> events;
    std::optional<ProviderType> fatal;
    {
        std::lock_guard lock(events_mutex_);
        events.swap(pending_events_);
        fatal.swap(fatal_provider_);
    }

    for (auto& event : events) {
        broadcast(event);
    }

    // A provider that failed fatally is torn down so the next session
    // connects afresh.
    if (fatal) {
        log(std::format("Tearing down {} after fatal error", provider_type_name(*fatal)));
        registry_.cleanup(*fatal);
    }
}

void DaemonCore::tick() {
    if (!session_ || session_->state() != SessionState::Recording) return;
    broadcast({{"event", "elapsed"}, {"seconds", session_->elapsed_seconds()}});
}

void DaemonCore::broadcast(const nlohmann::json& event) {
    std::erase_if(subscribers_, [&](int fd) {
        if (ipc_.send_message(fd, event)) return false;
        log("Dropping subscriber " + std::to_string(fd));
        return true;
    });
}

void DaemonCore::add_subscriber(int fd) {
    if (std::ranges::find(subscribers_, fd) == subscribers_.end()) {
        subscribers_.push_back(fd);
    }
}

void DaemonCore::remove_subscriber(int fd) {
    std::erase(subscribers_, fd);
}

SessionState DaemonCore::session_state() const {
    return session_ ? session_->state() : SessionState::Idle;
}

void DaemonCore::shutdown() {
    if (session_active()) {
        log("Stopping active session");
        session_->stop();
    }
    flush_events();
    session_.reset();
    registry_.cleanup();
}

nlohmann::json DaemonCore::error_response(const Error& error) {
    return error_response(error.kind, error.message);
}

nlohmann::json DaemonCore::error_response(ErrorKind kind, const std::string& message) {
    return {{"status", "error"}, {"kind", error_kind_name(kind)}, {"message", message}};
}

void DaemonCore::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[live-scribe] {}", msg);
    }
}
