#pragma once

#include "../ring_buffer.hpp"
#include "provider.hpp"
#include "transport.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

struct StreamingSettings {
    int max_reconnect_attempts = 3;
    std::chrono::milliseconds reconnect_backoff{500};
    std::chrono::milliseconds flush_timeout{3000};
    std::chrono::milliseconds keepalive_interval{5000};
    uint32_t buffer_seconds = 30;
};

// What a backend does with its connection while the session is paused.
enum class PausePolicy {
    KeepAlive, // connection stays open, keepalive message sent periodically
    Reconnect, // session is closed on pause and reopened on resume
    Idle,      // connection stays open, nothing is sent
};

// Base for backends that stream PCM over a message transport and receive
// transcription results on the same connection. One worker thread per
// started provider owns the transport; the capture thread only touches the
// audio ring.
class StreamingProvider : public TranscriptionProvider {
public:
    StreamingProvider(TransportFactory transport_factory, StreamingSettings settings);
    ~StreamingProvider() override;

    std::expected<void, Error> initialize(const ProviderOptions& options) override;
    std::expected<void, Error> start() override;
    void pause() override;
    void resume() override;
    void push_audio(std::span<const int16_t> samples) override;
    void stop() override;
    void cleanup() override;
    void set_event_sink(EventSink sink) override;

    bool is_started() const { return started_.load(std::memory_order_acquire); }
    bool is_paused() const { return paused_.load(std::memory_order_acquire); }
    bool is_degraded() const { return degraded_.load(std::memory_order_acquire); }
    uint64_t dropped_samples() const override { return ring_ ? ring_->dropped() : 0; }

protected:
    struct Endpoint {
        std::string url;
        std::vector<std::string> headers;
    };

    struct ParsedMessage {
        enum class Kind { Ignored, Result, EndOfStream, ServerError };
        Kind kind = Kind::Ignored;
        bool is_final = false;
        std::string text;
    };

    virtual std::expected<void, Error> validate(const ProviderOptions& options) = 0;
    // May block (token exchange). Called on start and on every reconnect.
    virtual std::expected<Endpoint, Error> endpoint() = 0;
    virtual ParsedMessage parse_message(const TransportMessage& msg) = 0;
    virtual PausePolicy pause_policy() const = 0;
    virtual std::optional<std::string> close_message() const { return std::nullopt; }
    virtual std::optional<std::string> keepalive_message() const { return std::nullopt; }
    virtual std::expected<void, Error> send_audio(MessageTransport& transport,
                                                  std::span<const int16_t> samples);

    const ProviderOptions& options() const { return options_; }
    const std::string& provider_name() const { return name_; }

private:
    void run(std::stop_token st);
    void halt_worker();
    std::expected<void, Error> send_pending_audio(bool everything);
    void handle_message(const TransportMessage& msg);
    void close_gracefully();
    void on_connection_lost(const Error& error, std::stop_token st);
    bool reconnect(std::stop_token st, bool immediate);
    bool wait_or_finish(std::chrono::milliseconds d);
    void emit(const ProviderEvent& event);
    void notice(BackendNotice::Severity severity, Error error);

    TransportFactory transport_factory_;
    StreamingSettings settings_;
    ProviderOptions options_;
    std::string name_;

    std::unique_ptr<RingBuffer<int16_t>> ring_;
    std::unique_ptr<MessageTransport> transport_; // worker-owned while started

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
    std::atomic<bool> torn_down_{false};
    std::atomic<bool> ended_{false};     // non-continuous recognition finished
    std::atomic<bool> suspended_{false}; // reconnects exhausted until resume()

    uint64_t sequence_ = 0;
    std::chrono::steady_clock::time_point last_keepalive_;
    std::jthread worker_;
};
