#include "capture_session.hpp"

#include <print>

std::string_view session_state_name(SessionState state) {
    switch (state) {
        case SessionState::Idle: return "idle";
        case SessionState::Recording: return "recording";
        case SessionState::Paused: return "paused";
        case SessionState::Stopped: return "stopped";
    }
    return "unknown";
}

CaptureSession::CaptureSession(ProviderRegistry& registry, AudioCapture& capture,
                               ProviderConfig config, Clock clock)
    : registry_(registry), capture_(capture), config_(std::move(config)),
      clock_(std::move(clock)) {}

CaptureSession::~CaptureSession() {
    std::shared_ptr<TranscriptionProvider> provider;
    {
        std::lock_guard lock(mutex_);
        ++generation_;
        provider = std::move(provider_);
    }
    release_capture();
    if (provider) provider->set_event_sink(nullptr);
}

std::expected<void, Error> CaptureSession::start() {
    uint64_t generation;
    {
        std::lock_guard lock(mutex_);
        if (state_ == SessionState::Stopped) {
            return std::unexpected(Error{ErrorKind::InvalidState,
                "session has stopped; start a new session"});
        }
        if (state_ != SessionState::Idle) {
            return std::unexpected(Error{ErrorKind::InvalidState, "session already started"});
        }
        generation = ++generation_;
        accumulator_.reset();
        degraded_ = false;
    }

    // Provider first: a configuration problem must not touch the microphone.
    auto resolved = registry_.get_provider(config_);
    if (!resolved) {
        return std::unexpected(resolved.error());
    }
    auto provider = std::move(*resolved);

    provider->set_event_sink([this, generation](const ProviderEvent& event) {
        handle_event(generation, event);
    });

    auto acquired = capture_.acquire([provider](std::span<const int16_t> samples) {
        provider->push_audio(samples);
    });
    if (!acquired) {
        provider->set_event_sink(nullptr);
        return std::unexpected(acquired.error());
    }
    {
        std::lock_guard lock(mutex_);
        capture_held_ = true;
    }

    if (auto res = provider->start(); !res) {
        release_capture();
        provider->set_event_sink(nullptr);
        return std::unexpected(res.error());
    }

    {
        std::lock_guard lock(mutex_);
        provider_ = provider;
        dropped_base_ = provider->dropped_samples();
        dropped_total_ = 0;
        accumulated_ = {};
        segment_start_ = clock_();
        state_ = SessionState::Recording;
    }
    notify_state(SessionState::Recording);
    return {};
}

std::expected<void, Error> CaptureSession::pause() {
    std::shared_ptr<TranscriptionProvider> provider;
    std::string final_text;
    {
        std::lock_guard lock(mutex_);
        if (state_ != SessionState::Recording) {
            return std::unexpected(Error{ErrorKind::InvalidState, "session is not recording"});
        }
        accumulated_ += clock_() - segment_start_;
        state_ = SessionState::Paused;
        accumulator_.clear_interim();
        final_text = accumulator_.final_text();
        provider = provider_;
    }

    capture_.set_muted(true);
    if (provider) provider->pause();

    notify_state(SessionState::Paused);
    notify_transcript(final_text, "");
    return {};
}

std::expected<void, Error> CaptureSession::resume() {
    std::shared_ptr<TranscriptionProvider> provider;
    {
        std::lock_guard lock(mutex_);
        if (state_ != SessionState::Paused) {
            return std::unexpected(Error{ErrorKind::InvalidState, "session is not paused"});
        }
        segment_start_ = clock_();
        state_ = SessionState::Recording;
        provider = provider_;
    }

    if (provider) provider->resume();
    capture_.set_muted(false);

    notify_state(SessionState::Recording);
    return {};
}

bool CaptureSession::stop() {
    std::shared_ptr<TranscriptionProvider> provider;
    {
        std::lock_guard lock(mutex_);
        if (state_ != SessionState::Recording && state_ != SessionState::Paused) {
            return false;
        }
        if (state_ == SessionState::Recording) {
            accumulated_ += clock_() - segment_start_;
        }
        state_ = SessionState::Stopped;
        // A stopped session never touches the provider again; the registry
        // owns it from here and may clean it up at any time.
        provider = std::move(provider_);
        if (provider) dropped_total_ = provider->dropped_samples() - dropped_base_;
    }

    release_capture();
    // Final events flushed here still carry the current generation.
    if (provider) provider->stop();

    std::string final_text;
    {
        std::lock_guard lock(mutex_);
        ++generation_;
        accumulator_.seal();
        final_text = accumulator_.final_text();
    }
    if (provider) provider->set_event_sink(nullptr);

    notify_transcript(final_text, "");
    notify_state(SessionState::Stopped);
    return true;
}

void CaptureSession::reset() {
    std::shared_ptr<TranscriptionProvider> provider;
    bool changed;
    {
        std::lock_guard lock(mutex_);
        changed = state_ != SessionState::Idle;
        ++generation_;
        state_ = SessionState::Idle;
        accumulated_ = {};
        degraded_ = false;
        accumulator_.reset();
        provider = std::move(provider_);
        dropped_total_ = 0;
    }

    release_capture();
    capture_.set_muted(false);
    if (provider) provider->set_event_sink(nullptr);

    if (changed) notify_state(SessionState::Idle);
}

SessionState CaptureSession::state() const {
    std::lock_guard lock(mutex_);
    return state_;
}

uint64_t CaptureSession::elapsed_seconds() const {
    std::lock_guard lock(mutex_);
    auto total = accumulated_;
    if (state_ == SessionState::Idle) return 0;
    if (state_ == SessionState::Recording) {
        total += clock_() - segment_start_;
    }
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(total).count();
    return seconds > 0 ? static_cast<uint64_t>(seconds) : 0;
}

uint64_t CaptureSession::dropped_samples() const {
    std::lock_guard lock(mutex_);
    if (provider_) return provider_->dropped_samples() - dropped_base_;
    return dropped_total_;
}

std::string CaptureSession::final_text() const {
    std::lock_guard lock(mutex_);
    return accumulator_.final_text();
}

std::string CaptureSession::interim_text() const {
    std::lock_guard lock(mutex_);
    return accumulator_.interim_text();
}

bool CaptureSession::degraded() const {
    std::lock_guard lock(mutex_);
    return degraded_;
}

void CaptureSession::handle_event(uint64_t generation, const ProviderEvent& event) {
    if (auto* notice = std::get_if<BackendNotice>(&event)) {
        handle_notice(generation, *notice);
        return;
    }

    auto& te = std::get<TranscriptEvent>(event);
    std::string final_text, interim_text;
    {
        std::lock_guard lock(mutex_);
        if (generation != generation_) return;
        // A paused session keeps finals but shows no new interim text.
        if (state_ == SessionState::Paused && !te.is_final) return;
        if (!accumulator_.apply(te)) return;
        final_text = accumulator_.final_text();
        interim_text = accumulator_.interim_text();
    }
    notify_transcript(final_text, interim_text);
}

void CaptureSession::handle_notice(uint64_t generation, const BackendNotice& notice) {
    std::shared_ptr<TranscriptionProvider> detached;
    bool fatal = false;
    std::string final_text;
    {
        std::lock_guard lock(mutex_);
        if (generation != generation_) return;

        switch (notice.severity) {
            case BackendNotice::Severity::Transient:
                break;
            case BackendNotice::Severity::Degraded:
                degraded_ = true;
                break;
            case BackendNotice::Severity::Restored:
                degraded_ = false;
                break;
            case BackendNotice::Severity::Fatal:
                if (state_ == SessionState::Recording || state_ == SessionState::Paused) {
                    if (state_ == SessionState::Recording) {
                        accumulated_ += clock_() - segment_start_;
                    }
                    state_ = SessionState::Stopped;
                    ++generation_;
                    accumulator_.seal();
                    final_text = accumulator_.final_text();
                    detached = std::move(provider_);
                    if (detached) dropped_total_ = detached->dropped_samples() - dropped_base_;
                    fatal = true;
                }
                break;
        }
    }

    if (on_notice_) on_notice_(notice);

    if (fatal) {
        std::println(stderr, "session: stopping after fatal backend error: {}",
                     notice.error.message);
        // The provider is not stopped here: this runs on its own thread, inside
        // its sink. Later events fail the generation check; the reference in
        // `detached` is dropped on return and the registry still holds one.
        release_capture();
        notify_transcript(final_text, "");
        notify_state(SessionState::Stopped);
    }
}

void CaptureSession::release_capture() {
    {
        std::lock_guard lock(mutex_);
        if (!capture_held_) return;
        capture_held_ = false;
    }
    capture_.release();
}

void CaptureSession::notify_state(SessionState state) {
    if (on_state_) on_state_(state);
}

void CaptureSession::notify_transcript(const std::string& final_text,
                                       const std::string& interim_text) {
    if (on_transcript_) on_transcript_(final_text, interim_text);
}
