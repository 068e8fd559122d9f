#include "streaming_provider.hpp"

#include <algorithm>
#include <print>

StreamingProvider::StreamingProvider(TransportFactory transport_factory, StreamingSettings settings)
    : transport_factory_(std::move(transport_factory)), settings_(settings) {}

// Derived destructors call cleanup() while their overrides still exist; this
// one only catches a provider that was never started.
StreamingProvider::~StreamingProvider() {
    cleanup();
}

std::expected<void, Error> StreamingProvider::initialize(const ProviderOptions& options) {
    if (torn_down_.load()) {
        return std::unexpected(Error{ErrorKind::InvalidState, "provider has been cleaned up"});
    }
    if (started_.load()) {
        if (options == options_) return {};
        return std::unexpected(Error{ErrorKind::InvalidState,
            "cannot reconfigure a started provider"});
    }
    if (options.sample_rate == 0) {
        return std::unexpected(Error{ErrorKind::Configuration, "sample_rate must be positive"});
    }
    if (auto res = validate(options); !res) {
        return res;
    }

    options_ = options;
    name_ = std::string(provider_type_name(type()));
    size_t capacity = static_cast<size_t>(options.sample_rate) *
                      std::max<uint32_t>(settings_.buffer_seconds, 1);
    ring_ = std::make_unique<RingBuffer<int16_t>>(capacity);
    initialized_.store(true, std::memory_order_release);
    return {};
}

std::expected<void, Error> StreamingProvider::start() {
    if (torn_down_.load()) {
        return std::unexpected(Error{ErrorKind::InvalidState, "provider has been cleaned up"});
    }
    if (!initialized_.load()) {
        return std::unexpected(Error{ErrorKind::Configuration, name_ + ": not initialized"});
    }
    if (started_.load()) {
        if (!ended_.load() && !suspended_.load()) {
            paused_.store(false, std::memory_order_release);
            cv_.notify_all();
            return {};
        }
        // The previous session finished or gave up on the backend; a new one
        // gets a fresh connection.
        halt_worker();
    }

    auto ep = endpoint();
    if (!ep) {
        return std::unexpected(ep.error());
    }

    auto transport = transport_factory_();
    if (!transport) {
        return std::unexpected(Error{ErrorKind::BackendConnection, name_ + ": no transport"});
    }
    if (auto res = transport->open(ep->url, ep->headers); !res) {
        transport->close();
        return std::unexpected(res.error());
    }

    transport_ = std::move(transport);
    ring_->clear();
    {
        std::lock_guard lock(mutex_);
        finish_requested_ = false;
        abort_requested_ = false;
    }
    paused_.store(false);
    ended_.store(false);
    suspended_.store(false);
    degraded_.store(false);
    last_keepalive_ = std::chrono::steady_clock::now();
    started_.store(true, std::memory_order_release);

    worker_ = std::jthread([this](std::stop_token st) { run(st); });
    return {};
}

void StreamingProvider::pause() {
    if (!started_.load()) return;
    paused_.store(true, std::memory_order_release);
    cv_.notify_all();
}

void StreamingProvider::resume() {
    if (!started_.load()) return;
    paused_.store(false, std::memory_order_release);
    suspended_.store(false, std::memory_order_release);
    cv_.notify_all();
}

void StreamingProvider::push_audio(std::span<const int16_t> samples) {
    if (!started_.load(std::memory_order_acquire) || paused_.load(std::memory_order_relaxed)) {
        return;
    }
    ring_->push(samples);
}

void StreamingProvider::stop() {
    if (!started_.load()) return;

    {
        std::lock_guard lock(mutex_);
        finish_requested_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }

    transport_.reset();
    started_.store(false, std::memory_order_release);
    paused_.store(false);
}

void StreamingProvider::cleanup() {
    {
        std::lock_guard lock(sink_mutex_);
        sink_ = nullptr;
    }

    halt_worker();
    if (ring_) ring_->clear();
    initialized_.store(false);
    torn_down_.store(true);
}

// Ends the worker without flushing and drops the connection.
void StreamingProvider::halt_worker() {
    {
        std::lock_guard lock(mutex_);
        abort_requested_ = true;
        finish_requested_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }

    if (transport_) {
        transport_->close();
        transport_.reset();
    }
    started_.store(false, std::memory_order_release);
    paused_.store(false);
}

void StreamingProvider::set_event_sink(EventSink sink) {
    std::lock_guard lock(sink_mutex_);
    sink_ = std::move(sink);
}

std::expected<void, Error> StreamingProvider::send_audio(MessageTransport& transport,
                                                         std::span<const int16_t> samples) {
    auto bytes = std::as_bytes(samples);
    return transport.send_binary({reinterpret_cast<const uint8_t*>(bytes.data()), bytes.size()});
}

void StreamingProvider::run(std::stop_token st) {
    bool closed_for_pause = false;

    while (!st.stop_requested()) {
        {
            std::lock_guard lock(mutex_);
            if (finish_requested_) break;
        }

        bool paused = paused_.load(std::memory_order_acquire);
        bool open = transport_ && transport_->is_open();

        if (ended_.load() || suspended_.load()) {
            if (open && ended_.load()) close_gracefully();
            ring_->clear();
            wait_or_finish(std::chrono::milliseconds(50));
            continue;
        }

        if (!open) {
            if (paused && pause_policy() == PausePolicy::Reconnect) {
                wait_or_finish(std::chrono::milliseconds(50));
                continue;
            }
            if (closed_for_pause) {
                closed_for_pause = false;
                reconnect(st, true);
                continue;
            }
            on_connection_lost(Error{ErrorKind::BackendConnection, "backend closed the stream"}, st);
            continue;
        }

        if (paused && pause_policy() == PausePolicy::Reconnect) {
            close_gracefully();
            closed_for_pause = true;
            continue;
        }

        if (!paused) {
            if (auto res = send_pending_audio(false); !res) {
                on_connection_lost(res.error(), st);
                continue;
            }
        } else if (pause_policy() == PausePolicy::KeepAlive) {
            auto now = std::chrono::steady_clock::now();
            auto keepalive = keepalive_message();
            if (keepalive && now - last_keepalive_ >= settings_.keepalive_interval) {
                last_keepalive_ = now;
                if (auto res = transport_->send_text(*keepalive); !res) {
                    on_connection_lost(res.error(), st);
                    continue;
                }
            }
        }

        auto msg = transport_->receive(20);
        if (!msg) {
            on_connection_lost(msg.error(), st);
            continue;
        }
        if (*msg) {
            handle_message(**msg);
        }
    }

    bool abort;
    {
        std::lock_guard lock(mutex_);
        abort = abort_requested_;
    }
    if (!abort && !ended_.load() && transport_ && transport_->is_open()) {
        if (send_pending_audio(true)) {
            close_gracefully();
        }
    }
    if (transport_) {
        transport_->close();
    }
}

std::expected<void, Error> StreamingProvider::send_pending_audio(bool everything) {
    size_t chunk = std::max<size_t>(options_.sample_rate / 10, 1);
    std::vector<int16_t> buf(chunk);

    while (ring_->size() >= chunk || (everything && ring_->size() > 0)) {
        size_t n = ring_->pop(buf);
        if (auto res = send_audio(*transport_, {buf.data(), n}); !res) {
            return res;
        }
    }
    return {};
}

void StreamingProvider::handle_message(const TransportMessage& msg) {
    auto parsed = parse_message(msg);

    switch (parsed.kind) {
        case ParsedMessage::Kind::Ignored:
            return;
        case ParsedMessage::Kind::ServerError:
            notice(BackendNotice::Severity::Transient,
                   Error{ErrorKind::BackendConnection, parsed.text});
            return;
        case ParsedMessage::Kind::EndOfStream:
            transport_->close();
            return;
        case ParsedMessage::Kind::Result:
            break;
    }

    // Single-utterance recognition already delivered its final.
    if (ended_.load()) return;

    // An empty interim is forwarded: it retracts the previous hypothesis.
    if (!parsed.is_final) {
        if (!options_.interim_results) return;
        emit(TranscriptEvent{sequence_, false, std::move(parsed.text)});
        return;
    }

    emit(TranscriptEvent{sequence_, true, std::move(parsed.text)});
    ++sequence_;
    if (!options_.continuous) {
        ended_.store(true);
    }
}

void StreamingProvider::close_gracefully() {
    auto deadline = std::chrono::steady_clock::now() + settings_.flush_timeout;
    auto close_msg = close_message();

    if (close_msg) {
        if (auto res = transport_->send_text(*close_msg); !res) {
            transport_->close();
            return;
        }
    }

    // Without a protocol close the backend is drained until it goes quiet.
    int wait_ms = close_msg ? 50 : 300;
    while (transport_->is_open() && std::chrono::steady_clock::now() < deadline) {
        auto msg = transport_->receive(wait_ms);
        if (!msg) break;
        if (!*msg) {
            if (!close_msg) break;
            continue;
        }
        handle_message(**msg);
    }
    transport_->close();
}

void StreamingProvider::on_connection_lost(const Error& error, std::stop_token st) {
    if (transport_) transport_->close();
    notice(BackendNotice::Severity::Transient,
           Error{error.kind, error.message + ", reconnecting"});
    reconnect(st, false);
}

bool StreamingProvider::reconnect(std::stop_token st, bool immediate) {
    Error last{ErrorKind::BackendConnection, "no attempts made"};

    for (int attempt = 1; attempt <= settings_.max_reconnect_attempts; ++attempt) {
        if (st.stop_requested()) return false;
        if (!(immediate && attempt == 1) && !wait_or_finish(settings_.reconnect_backoff * attempt)) {
            return false;
        }

        auto ep = endpoint();
        if (!ep) {
            if (ep.error().kind == ErrorKind::Configuration) {
                ended_.store(true);
                notice(BackendNotice::Severity::Fatal, ep.error());
                return false;
            }
            last = ep.error();
            continue;
        }

        auto transport = transport_factory_();
        if (!transport) continue;

        auto res = transport->open(ep->url, ep->headers);
        if (res) {
            transport_ = std::move(transport);
            last_keepalive_ = std::chrono::steady_clock::now();
            if (degraded_.exchange(false)) {
                notice(BackendNotice::Severity::Restored,
                       Error{ErrorKind::BackendConnection, "backend connection restored"});
            }
            return true;
        }

        if (res.error().kind == ErrorKind::Configuration) {
            ended_.store(true);
            notice(BackendNotice::Severity::Fatal, res.error());
            return false;
        }
        last = res.error();
    }

    degraded_.store(true);
    suspended_.store(true);
    notice(BackendNotice::Severity::Degraded,
           Error{ErrorKind::BackendConnection,
                 "reconnect failed after " + std::to_string(settings_.max_reconnect_attempts) +
                 " attempts: " + last.message});
    return false;
}

bool StreamingProvider::wait_or_finish(std::chrono::milliseconds d) {
    std::unique_lock lock(mutex_);
    cv_.wait_for(lock, d, [this] { return finish_requested_; });
    return !finish_requested_;
}

void StreamingProvider::emit(const ProviderEvent& event) {
    std::lock_guard lock(sink_mutex_);
    if (sink_) sink_(event);
}

void StreamingProvider::notice(BackendNotice::Severity severity, Error error) {
    std::println(stderr, "{}: {} ({})", name_, error.message, severity_name(severity));
    emit(BackendNotice{severity, std::move(error)});
}
