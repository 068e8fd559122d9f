#pragma once

#include "../ring_buffer.hpp"
#include "provider.hpp"
#include "recognizer.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

struct LocalEngineSettings {
    uint32_t step_ms = 1000;           // interim re-decode interval
    uint32_t silence_ms = 800;         // trailing silence that closes an utterance
    uint32_t max_utterance_ms = 15000;
    uint32_t max_failures = 3;         // consecutive decode failures before Degraded
    uint32_t silence_threshold = 500;  // RMS below this counts as silence
    uint32_t buffer_seconds = 30;

    // Reads overrides from options.extra (step_ms, silence_ms, ...).
    static std::expected<LocalEngineSettings, Error>
        from_options(const ProviderOptions& options, LocalEngineSettings defaults);
};

// On-device recognition. Audio is cut into utterances by an energy detector;
// the open utterance is re-decoded every step for interim results and
// decoded once more when it closes.
class LocalEngineProvider : public TranscriptionProvider {
public:
    LocalEngineProvider(RecognizerFactory recognizer_factory, LocalEngineSettings defaults = {});
    ~LocalEngineProvider() override;

    ProviderType type() const override { return ProviderType::Local; }

    std::expected<void, Error> initialize(const ProviderOptions& options) override;
    std::expected<void, Error> start() override;
    void pause() override;
    void resume() override;
    void push_audio(std::span<const int16_t> samples) override;
    void stop() override;
    void cleanup() override;
    void set_event_sink(EventSink sink) override;

    bool is_started() const { return started_.load(std::memory_order_acquire); }
    bool is_degraded() const { return degraded_.load(std::memory_order_acquire); }
    uint64_t dropped_samples() const override { return ring_ ? ring_->dropped() : 0; }
    const LocalEngineSettings& settings() const { return settings_; }

private:
    void run(std::stop_token st);
    void halt_worker();
    void consume(std::span<const int16_t> chunk);
    void decode_interim();
    void finalize_utterance();
    std::expected<std::string, Error> decode();
    void emit(const ProviderEvent& event);
    void notice(BackendNotice::Severity severity, Error error);

    size_t ms_to_samples(uint32_t ms) const {
        return static_cast<size_t>(options_.sample_rate) * ms / 1000;
    }

    RecognizerFactory recognizer_factory_;
    LocalEngineSettings defaults_;
    LocalEngineSettings settings_;
    ProviderOptions options_;

    std::unique_ptr<SpeechRecognizer> recognizer_;
    std::unique_ptr<RingBuffer<int16_t>> ring_;

    // Worker-thread state
    std::vector<int16_t> utterance_;
    bool voiced_ = false;
    size_t trailing_silence_ = 0;
    size_t decoded_size_ = 0;
    uint32_t failures_ = 0;
    uint64_t sequence_ = 0;

    std::mutex mutex_;
    std::condition_variable cv_;
    bool finish_requested_ = false;
    bool abort_requested_ = false;

    std::mutex sink_mutex_;
    EventSink sink_;

    std::atomic<bool> initialized_{false};
    std::atomic<bool> started_{false};
    std::atomic<bool> paused_{false};
    std::atomic<bool> degraded_{false};
    std::atomic<bool> ended_{false};
    std::atomic<bool> torn_down_{false};
    std::jthread worker_;
};
