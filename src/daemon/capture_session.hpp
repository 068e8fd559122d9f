#pragma once

#include "platform/audio_capture.hpp"
#include "stt/provider.hpp"
#include "stt/provider_registry.hpp"
#include "stt/transcript_accumulator.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

enum class SessionState { Idle, Recording, Paused, Stopped };

std::string_view session_state_name(SessionState state);

// One recording lifetime: Idle -> Recording <-> Paused -> Stopped. Control
// methods are called from a single thread; provider events arrive on the
// provider's own threads. Callbacks are registered before start() and run
// without the session lock held.
class CaptureSession {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;
    using TranscriptCallback = std::function<void(const std::string& final_text,
                                                  const std::string& interim_text)>;
    using NoticeCallback = std::function<void(const BackendNotice&)>;
    using StateCallback = std::function<void(SessionState)>;

    CaptureSession(ProviderRegistry& registry, AudioCapture& capture, ProviderConfig config,
                   Clock clock = std::chrono::steady_clock::now);
    ~CaptureSession();

    CaptureSession(const CaptureSession&) = delete;
    CaptureSession& operator=(const CaptureSession&) = delete;

    std::expected<void, Error> start();
    std::expected<void, Error> pause();
    std::expected<void, Error> resume();
    // Flushes the provider and releases the microphone. False if the
    // session was not Recording or Paused.
    bool stop();
    // Forces Idle from any state; the provider is detached but not stopped.
    void reset();

    SessionState state() const;
    uint64_t elapsed_seconds() const;
    std::string final_text() const;
    std::string interim_text() const;
    bool degraded() const;
    // Audio lost to a full provider buffer during this session.
    uint64_t dropped_samples() const;
    ProviderType provider_type() const { return config_.type; }

    void on_transcript_update(TranscriptCallback cb) { on_transcript_ = std::move(cb); }
    void on_notice(NoticeCallback cb) { on_notice_ = std::move(cb); }
    void on_state_change(StateCallback cb) { on_state_ = std::move(cb); }

private:
    void handle_event(uint64_t generation, const ProviderEvent& event);
    void handle_notice(uint64_t generation, const BackendNotice& notice);
    void release_capture();
    void notify_state(SessionState state);
    void notify_transcript(const std::string& final_text, const std::string& interim_text);

    ProviderRegistry& registry_;
    AudioCapture& capture_;
    ProviderConfig config_;
    Clock clock_;

    TranscriptCallback on_transcript_;
    NoticeCallback on_notice_;
    StateCallback on_state_;

    mutable std::mutex mutex_;
    SessionState state_ = SessionState::Idle;
    uint64_t generation_ = 0;
    bool capture_held_ = false;
    bool degraded_ = false;
    std::chrono::steady_clock::duration accumulated_{};
    std::chrono::steady_clock::time_point segment_start_;
    TranscriptAccumulator accumulator_;
    std::shared_ptr<TranscriptionProvider> provider_;
    uint64_t dropped_base_ = 0;  // provider counter when the session started
    uint64_t dropped_total_ = 0; // frozen once the provider is let go
};
