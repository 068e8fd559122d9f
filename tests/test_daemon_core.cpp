#include <catch2/catch_test_macros.hpp>

#include "daemon_core.hpp"
#include "test_doubles.hpp"

#include <cstdlib>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <set>
#include <string>
#include <vector>

using json = nlohmann::json;
using namespace std::chrono_literals;

namespace {

// Records what the core sends; no sockets involved.
class RecordingIpcServer : public IpcServer {
public:
    bool start(const std::string&) override { return true; }
    void stop() override {}
    int server_fd() const override { return -1; }
    int accept_client() override { return -1; }
    bool read_commands(int, std::vector<json>&) override { return true; }

    bool send_message(int client_fd, const json& response) override {
        if (broken.contains(client_fd)) return false;
        sent[client_fd].push_back(response);
        return true;
    }

    void close_client(int) override {}

    std::vector<json> events(int fd, const std::string& type) {
        std::vector<json> out;
        for (auto& e : sent[fd]) {
            if (e.value("event", "") == type) out.push_back(e);
        }
        return out;
    }

    std::map<int, std::vector<json>> sent;
    std::set<int> broken;
};

struct Fixture {
    FakeClock clock;
    MockAudioCapture capture;
    RecordingIpcServer ipc;
    ProviderRegistry registry;
    std::map<ProviderType, FakeProvider*> built; // valid while the registry holds it
    std::map<ProviderType, std::shared_ptr<FakeProvider::Stats>> stats;
    int constructed = 0;
    int notifications = 0;
    Config config;

    Fixture() {
        for (auto type : {ProviderType::Deepgram, ProviderType::AssemblyAI}) {
            registry.register_constructor(type,
                [this](const ProviderConfig& cfg) -> std::unique_ptr<TranscriptionProvider> {
                    auto p = std::make_unique<FakeProvider>(cfg.type, cfg.credential);
                    p->requires_credential = true;
                    built[cfg.type] = p.get();
                    stats[cfg.type] = p->stats;
                    ++constructed;
                    return p;
                });
        }
        config.set_credential(ProviderType::Deepgram, "dg-key");
        config.set_credential(ProviderType::AssemblyAI, "aai-key");
    }

    std::unique_ptr<DaemonCore> make_core() {
        auto core = std::make_unique<DaemonCore>(config, false, registry, capture, ipc,
                                                 [this] { ++notifications; }, clock.fn());
        REQUIRE(core->init());
        return core;
    }
};

json cmd(const std::string& name, json extra = json::object()) {
    extra["cmd"] = name;
    return extra;
}

json run(DaemonCore& core, const json& c) {
    return core.handle_command(c["cmd"].get<std::string>(), c);
}

} // namespace

TEST_CASE("DaemonCore", "[daemon]") {
    Fixture fx;

    auto core = fx.make_core();

    SECTION("UnknownConfiguredProvider") {
        Config bad = fx.config;
        bad.provider.type = "webspeech";
        DaemonCore other(bad, false, fx.registry, fx.capture, fx.ipc, nullptr);
        REQUIRE_FALSE(other.init());
    }

    SECTION("StatusWhenIdle") {
        auto r = run(*core, cmd("status"));
        REQUIRE(r["status"] == "ok");
        REQUIRE(r["state"] == "idle");
        REQUIRE(r["provider"] == "deepgram");
        REQUIRE(r["available"] == true);
        REQUIRE(r["elapsed"] == 0);
        REQUIRE(r["degraded"] == false);
        REQUIRE(r["dropped_samples"] == 0);
    }

    SECTION("StatusReportsDroppedAudioForThisSession") {
        REQUIRE(run(*core, cmd("start"))["status"] == "ok");
        REQUIRE(run(*core, cmd("stop"))["status"] == "ok");

        // Overflow from the previous session is not counted again
        auto* provider = fx.built[ProviderType::Deepgram];
        provider->dropped = 40;
        REQUIRE(run(*core, cmd("start"))["status"] == "ok");
        provider->dropped = 100;
        REQUIRE(run(*core, cmd("status"))["dropped_samples"] == 60);

        REQUIRE(run(*core, cmd("stop"))["status"] == "ok");
        REQUIRE(run(*core, cmd("status"))["dropped_samples"] == 60);
    }

    SECTION("UnknownCommand") {
        auto r = run(*core, cmd("explode"));
        REQUIRE(r["status"] == "error");
    }

    SECTION("FullSessionOverCommands") {
        auto r = run(*core, cmd("start"));
        REQUIRE(r["status"] == "ok");
        REQUIRE(r["state"] == "recording");
        REQUIRE(r["provider"] == "deepgram");
        REQUIRE(fx.capture.is_acquired());

        auto* provider = fx.built[ProviderType::Deepgram];
        REQUIRE(provider->credential() == std::optional<std::string>("dg-key"));
        provider->emit_text(0, true, "first part");

        fx.clock.advance(2000ms);
        r = run(*core, cmd("pause"));
        REQUIRE(r["state"] == "paused");
        REQUIRE(r["elapsed"] == 2);

        r = run(*core, cmd("resume"));
        REQUIRE(r["state"] == "recording");

        provider->emit_text(1, false, "sec");
        r = run(*core, cmd("transcript"));
        REQUIRE(r["final"] == "first part");
        REQUIRE(r["interim"] == "sec");

        provider->emit_text(1, true, "second part");
        fx.clock.advance(1000ms);

        r = run(*core, cmd("stop"));
        REQUIRE(r["status"] == "ok");
        REQUIRE(r["state"] == "stopped");
        REQUIRE(r["text"] == "first part second part");
        REQUIRE(r["elapsed"] == 3);
        REQUIRE_FALSE(fx.capture.is_acquired());

        r = run(*core, cmd("status"));
        REQUIRE(r["state"] == "stopped");
        REQUIRE(r["elapsed"] == 3);
    }

    SECTION("StartTwiceRefused") {
        REQUIRE(run(*core, cmd("start"))["status"] == "ok");
        auto r = run(*core, cmd("start"));
        REQUIRE(r["status"] == "error");
        REQUIRE(r["kind"] == "invalid_state");
    }

    SECTION("StartAgainAfterStop") {
        REQUIRE(run(*core, cmd("start"))["status"] == "ok");
        fx.built[ProviderType::Deepgram]->emit_text(0, true, "old");
        REQUIRE(run(*core, cmd("stop"))["status"] == "ok");

        REQUIRE(run(*core, cmd("start"))["status"] == "ok");
        REQUIRE(run(*core, cmd("transcript"))["final"] == "");
    }

    SECTION("StartWithProviderOverride") {
        auto r = run(*core, cmd("start", {{"provider", "assemblyai"}}));
        REQUIRE(r["status"] == "ok");
        REQUIRE(r["provider"] == "assemblyai");
        REQUIRE(fx.built.contains(ProviderType::AssemblyAI));
        REQUIRE(core->active_provider() == ProviderType::AssemblyAI);
    }

    SECTION("StartUnknownProvider") {
        auto r = run(*core, cmd("start", {{"provider", "webspeech"}}));
        REQUIRE(r["status"] == "error");
        REQUIRE(r["kind"] == "unsupported_provider");
        REQUIRE_FALSE(fx.capture.is_acquired());
    }

    SECTION("StartUnavailableProvider") {
        auto r = run(*core, cmd("start", {{"provider", "realtimestt"}}));
        REQUIRE(r["status"] == "error");
        REQUIRE(r["kind"] == "unsupported_provider");
    }

    SECTION("StartWithoutCredential") {
        fx.config.providers.clear();
        ::unsetenv("DEEPGRAM_API_KEY");
        auto keyless = fx.make_core();
        auto r = run(*keyless, cmd("start"));
        REQUIRE(r["status"] == "error");
        REQUIRE(r["kind"] == "configuration");
        REQUIRE(fx.capture.acquire_calls == 0);
    }

    SECTION("MicrophoneDenied") {
        fx.capture.fail_with = Error{ErrorKind::PermissionDenied, "microphone access denied"};
        auto r = run(*core, cmd("start"));
        REQUIRE(r["status"] == "error");
        REQUIRE(r["kind"] == "permission_denied");
        REQUIRE(run(*core, cmd("status"))["state"] == "idle");
    }

    SECTION("ControlWithoutSession") {
        REQUIRE(run(*core, cmd("pause"))["kind"] == "invalid_state");
        REQUIRE(run(*core, cmd("resume"))["kind"] == "invalid_state");
        REQUIRE(run(*core, cmd("stop"))["kind"] == "invalid_state");
        REQUIRE(run(*core, cmd("transcript"))["final"] == "");
        REQUIRE(run(*core, cmd("reset"))["state"] == "idle");
    }

    SECTION("ResetDiscardsAndTearsDownProvider") {
        REQUIRE(run(*core, cmd("start"))["status"] == "ok");
        auto* provider = fx.built[ProviderType::Deepgram];
        provider->emit_text(0, true, "discard");

        auto r = run(*core, cmd("reset"));
        REQUIRE(r["state"] == "idle");
        REQUIRE(core->session_state() == SessionState::Idle);
        REQUIRE_FALSE(fx.capture.is_acquired());
        REQUIRE_FALSE(fx.registry.is_cached(ProviderType::Deepgram));
        REQUIRE(fx.stats[ProviderType::Deepgram]->cleanup_calls == 1);
        REQUIRE(fx.stats[ProviderType::Deepgram]->stop_calls == 0);
        REQUIRE(run(*core, cmd("transcript"))["final"] == "");
    }

    SECTION("SubscribersReceiveSessionEvents") {
        core->add_subscriber(7);
        core->add_subscriber(7);
        REQUIRE(core->subscriber_count() == 1);

        REQUIRE(run(*core, cmd("start"))["status"] == "ok");
        fx.built[ProviderType::Deepgram]->emit_text(0, false, "hi");
        REQUIRE(fx.notifications >= 2);
        // Nothing goes out until the loop flushes
        REQUIRE(fx.ipc.sent[7].empty());

        core->flush_events();
        auto states = fx.ipc.events(7, "state");
        REQUIRE(states.size() == 1);
        REQUIRE(states[0]["state"] == "recording");
        auto transcripts = fx.ipc.events(7, "transcript");
        REQUIRE(transcripts.size() == 1);
        REQUIRE(transcripts[0]["interim"] == "hi");

        fx.ipc.sent.clear();
        REQUIRE(run(*core, cmd("stop"))["status"] == "ok");
        core->flush_events();
        // Final transcript precedes the stopped state
        REQUIRE(fx.ipc.sent[7].size() == 2);
        REQUIRE(fx.ipc.sent[7][0]["event"] == "transcript");
        REQUIRE(fx.ipc.sent[7][1]["state"] == "stopped");
    }

    SECTION("TickBroadcastsElapsedWhileRecording") {
        core->add_subscriber(3);
        core->tick();
        REQUIRE(fx.ipc.events(3, "elapsed").empty());

        REQUIRE(run(*core, cmd("start"))["status"] == "ok");
        fx.clock.advance(61000ms);
        core->tick();
        auto elapsed = fx.ipc.events(3, "elapsed");
        REQUIRE(elapsed.size() == 1);
        REQUIRE(elapsed[0]["seconds"] == 61);

        REQUIRE(run(*core, cmd("pause"))["status"] == "ok");
        core->tick();
        REQUIRE(fx.ipc.events(3, "elapsed").size() == 1);
    }

    SECTION("FailedSubscriberDropped") {
        core->add_subscriber(4);
        core->add_subscriber(5);
        fx.ipc.broken.insert(4);

        REQUIRE(run(*core, cmd("start"))["status"] == "ok");
        core->flush_events();
        REQUIRE(core->subscriber_count() == 1);
        REQUIRE(fx.ipc.events(5, "state").size() == 1);

        core->remove_subscriber(5);
        REQUIRE(core->subscriber_count() == 0);
    }

    SECTION("NoticesAreForwarded") {
        core->add_subscriber(9);
        REQUIRE(run(*core, cmd("start"))["status"] == "ok");
        fx.built[ProviderType::Deepgram]->emit(BackendNotice{
            BackendNotice::Severity::Degraded, Error{ErrorKind::BackendConnection, "lost"}});
        core->flush_events();

        auto notices = fx.ipc.events(9, "notice");
        REQUIRE(notices.size() == 1);
        REQUIRE(notices[0]["severity"] == "degraded");
        REQUIRE(notices[0]["kind"] == "backend_connection");
        REQUIRE(run(*core, cmd("status"))["degraded"] == true);
    }

    SECTION("FatalNoticeTearsDownProvider") {
        REQUIRE(run(*core, cmd("start"))["status"] == "ok");
        fx.built[ProviderType::Deepgram]->emit(BackendNotice{
            BackendNotice::Severity::Fatal, Error{ErrorKind::Configuration, "key revoked"}});
        REQUIRE(core->session_state() == SessionState::Stopped);
        REQUIRE(fx.registry.is_cached(ProviderType::Deepgram));

        core->flush_events();
        REQUIRE_FALSE(fx.registry.is_cached(ProviderType::Deepgram));
    }

    SECTION("StartRightAfterFatalUsesFreshProvider") {
        REQUIRE(run(*core, cmd("start"))["status"] == "ok");
        auto failed = fx.stats[ProviderType::Deepgram];
        fx.built[ProviderType::Deepgram]->emit(BackendNotice{
            BackendNotice::Severity::Fatal, Error{ErrorKind::BackendConnection, "stream died"}});

        // The loop has not flushed yet when the next start arrives
        auto r = run(*core, cmd("start"));
        REQUIRE(r["status"] == "ok");
        REQUIRE(failed->cleanup_calls == 1);
        REQUIRE(fx.constructed == 2);
        REQUIRE(fx.built[ProviderType::Deepgram]->started);

        auto fresh = fx.stats[ProviderType::Deepgram];
        core->flush_events();
        REQUIRE(fx.registry.is_cached(ProviderType::Deepgram));
        REQUIRE(fresh->cleanup_calls == 0);

        fx.built[ProviderType::Deepgram]->emit_text(0, true, "still listening");
        REQUIRE(run(*core, cmd("transcript"))["final"] == "still listening");
    }

    SECTION("ProviderCommandSetsCredential") {
        auto r = run(*core, cmd("provider", {{"name", "assemblyai"}, {"credential", "new-secret"}}));
        REQUIRE(r["status"] == "ok");
        REQUIRE(r["provider"] == "assemblyai");
        REQUIRE(r["credential"] == credential_fingerprint(std::string("new-secret")));
        REQUIRE(r.dump().find("new-secret") == std::string::npos);
        REQUIRE(core->active_provider() == ProviderType::AssemblyAI);

        REQUIRE(run(*core, cmd("start"))["status"] == "ok");
        REQUIRE(fx.built[ProviderType::AssemblyAI]->credential() ==
                std::optional<std::string>("new-secret"));
    }

    SECTION("ProviderCommandDuringSession") {
        REQUIRE(run(*core, cmd("start"))["status"] == "ok");
        auto r = run(*core, cmd("provider", {{"name", "assemblyai"}}));
        REQUIRE(r["status"] == "ok");
        REQUIRE(r.contains("message"));
        // The running session keeps its backend
        REQUIRE(run(*core, cmd("status"))["state"] == "recording");
    }

    SECTION("ProviderCommandErrors") {
        REQUIRE(run(*core, cmd("provider", {{"name", "webspeech"}}))["kind"] == "unsupported_provider");
        REQUIRE(run(*core, cmd("provider", {{"name", "local"}}))["kind"] == "unsupported_provider");
    }

    SECTION("CredentialChangeReplacesCachedProvider") {
        REQUIRE(run(*core, cmd("start"))["status"] == "ok");
        REQUIRE(run(*core, cmd("stop"))["status"] == "ok");
        auto first = fx.stats[ProviderType::Deepgram];

        // Same credential: the cached instance is reused
        REQUIRE(run(*core, cmd("start"))["status"] == "ok");
        REQUIRE(run(*core, cmd("stop"))["status"] == "ok");
        REQUIRE(fx.constructed == 1);

        run(*core, cmd("provider", {{"name", "deepgram"}, {"credential", "rotated"}}));
        REQUIRE(run(*core, cmd("start"))["status"] == "ok");
        REQUIRE(fx.constructed == 2);
        REQUIRE(first->cleanup_calls == 1);
        REQUIRE(fx.registry.size() == 1);
    }

    SECTION("CleanupCommand") {
        REQUIRE(run(*core, cmd("start"))["status"] == "ok");

        auto r = run(*core, cmd("cleanup", {{"type", "deepgram"}}));
        REQUIRE(r["kind"] == "invalid_state");
        REQUIRE(run(*core, cmd("cleanup"))["kind"] == "invalid_state");
        // Other backends may be cleaned while recording
        REQUIRE(run(*core, cmd("cleanup", {{"type", "assemblyai"}}))["status"] == "ok");
        REQUIRE(run(*core, cmd("cleanup", {{"type", "nope"}}))["kind"] == "unsupported_provider");

        REQUIRE(run(*core, cmd("stop"))["status"] == "ok");
        r = run(*core, cmd("cleanup"));
        REQUIRE(r["status"] == "ok");
        REQUIRE(r["cached"] == 0);
        REQUIRE(fx.stats[ProviderType::Deepgram]->cleanup_calls == 1);
    }

    SECTION("ShutdownStopsActiveSession") {
        core->add_subscriber(2);
        REQUIRE(run(*core, cmd("start"))["status"] == "ok");

        core->shutdown();
        REQUIRE(fx.stats[ProviderType::Deepgram]->stop_calls == 1);
        REQUIRE_FALSE(fx.capture.is_acquired());
        REQUIRE(fx.registry.size() == 0);
        REQUIRE(fx.ipc.events(2, "state").back()["state"] == "stopped");
    }
}
