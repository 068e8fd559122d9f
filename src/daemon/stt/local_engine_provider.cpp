#include "local_engine_provider.hpp"

#include <algorithm>
#include <charconv>
#include <chrono>
#include <cmath>
#include <print>

static constexpr uint32_t PRE_ROLL_MS = 200;
static constexpr uint32_t POLL_MS = 20;

static std::expected<uint32_t, Error> parse_setting(const ProviderOptions& options,
                                                    const std::string& key, uint32_t fallback) {
    auto it = options.extra.find(key);
    if (it == options.extra.end()) return fallback;

    uint32_t value = 0;
    auto& s = it->second;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size() || value == 0) {
        return std::unexpected(Error{ErrorKind::Configuration,
            "local: invalid value for " + key + ": '" + s + "'"});
    }
    return value;
}

std::expected<LocalEngineSettings, Error>
LocalEngineSettings::from_options(const ProviderOptions& options, LocalEngineSettings defaults) {
    LocalEngineSettings s = defaults;
    struct Field { const char* key; uint32_t* value; };
    for (auto [key, value] : {Field{"step_ms", &s.step_ms},
                              Field{"silence_ms", &s.silence_ms},
                              Field{"max_utterance_ms", &s.max_utterance_ms},
                              Field{"max_failures", &s.max_failures},
                              Field{"silence_threshold", &s.silence_threshold}}) {
        auto v = parse_setting(options, key, *value);
        if (!v) return std::unexpected(v.error());
        *value = *v;
    }
    return s;
}

LocalEngineProvider::LocalEngineProvider(RecognizerFactory recognizer_factory,
                                         LocalEngineSettings defaults)
    : recognizer_factory_(std::move(recognizer_factory)), defaults_(defaults), settings_(defaults) {}

LocalEngineProvider::~LocalEngineProvider() {
    cleanup();
}

std::expected<void, Error> LocalEngineProvider::initialize(const ProviderOptions& options) {
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

    auto settings = LocalEngineSettings::from_options(options, defaults_);
    if (!settings) {
        return std::unexpected(settings.error());
    }

    // Model loading is expensive; a repeated call with the same options keeps it.
    if (!recognizer_ || !(options == options_)) {
        auto recognizer = recognizer_factory_(options);
        if (!recognizer) {
            return std::unexpected(recognizer.error());
        }
        recognizer_ = std::move(*recognizer);
    }

    options_ = options;
    settings_ = *settings;
    ring_ = std::make_unique<RingBuffer<int16_t>>(
        static_cast<size_t>(options.sample_rate) * std::max<uint32_t>(settings_.buffer_seconds, 1));
    initialized_.store(true, std::memory_order_release);
    return {};
}

std::expected<void, Error> LocalEngineProvider::start() {
    if (torn_down_.load()) {
        return std::unexpected(Error{ErrorKind::InvalidState, "provider has been cleaned up"});
    }
    if (!initialized_.load()) {
        return std::unexpected(Error{ErrorKind::Configuration, "local: not initialized"});
    }
    if (started_.load()) {
        if (!ended_.load()) {
            paused_.store(false, std::memory_order_release);
            return {};
        }
        // Single-utterance recognition finished; begin a new one.
        halt_worker();
    }

    ring_->clear();
    utterance_.clear();
    voiced_ = false;
    trailing_silence_ = 0;
    decoded_size_ = 0;
    failures_ = 0;
    {
        std::lock_guard lock(mutex_);
        finish_requested_ = false;
        abort_requested_ = false;
    }
    paused_.store(false);
    ended_.store(false);
    degraded_.store(false);
    started_.store(true, std::memory_order_release);

    worker_ = std::jthread([this](std::stop_token st) { run(st); });
    return {};
}

void LocalEngineProvider::pause() {
    if (!started_.load()) return;
    paused_.store(true, std::memory_order_release);
    cv_.notify_all();
}

void LocalEngineProvider::resume() {
    if (!started_.load()) return;
    paused_.store(false, std::memory_order_release);
    cv_.notify_all();
}

void LocalEngineProvider::push_audio(std::span<const int16_t> samples) {
    if (!started_.load(std::memory_order_acquire) || paused_.load(std::memory_order_relaxed)) {
        return;
    }
    ring_->push(samples);
}

void LocalEngineProvider::stop() {
    if (!started_.load()) return;

    {
        std::lock_guard lock(mutex_);
        finish_requested_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
    started_.store(false, std::memory_order_release);
    paused_.store(false);
}

void LocalEngineProvider::cleanup() {
    {
        std::lock_guard lock(sink_mutex_);
        sink_ = nullptr;
    }
    halt_worker();
    recognizer_.reset();
    if (ring_) ring_->clear();
    utterance_.clear();
    initialized_.store(false);
    torn_down_.store(true);
}

// Ends the worker without finalizing the open utterance.
void LocalEngineProvider::halt_worker() {
    {
        std::lock_guard lock(mutex_);
        abort_requested_ = true;
        finish_requested_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
    started_.store(false, std::memory_order_release);
    paused_.store(false);
}

void LocalEngineProvider::set_event_sink(EventSink sink) {
    std::lock_guard lock(sink_mutex_);
    sink_ = std::move(sink);
}

void LocalEngineProvider::run(std::stop_token st) {
    std::vector<int16_t> buf(std::max<size_t>(ms_to_samples(POLL_MS), 1));
    bool was_paused = false;

    while (!st.stop_requested()) {
        // Read before draining so audio pushed ahead of pause() lands in
        // the utterance it closes.
        bool paused = paused_.load(std::memory_order_acquire);

        size_t n;
        while ((n = ring_->pop(buf)) > 0) {
            consume({buf.data(), n});
        }

        if (paused && !was_paused) {
            finalize_utterance();
        }
        was_paused = paused;

        std::unique_lock lock(mutex_);
        if (cv_.wait_for(lock, std::chrono::milliseconds(POLL_MS),
                         [this] { return finish_requested_; })) {
            break;
        }
    }

    bool abort;
    {
        std::lock_guard lock(mutex_);
        abort = abort_requested_;
    }
    if (abort) return;

    size_t n;
    while ((n = ring_->pop(buf)) > 0) {
        consume({buf.data(), n});
    }
    finalize_utterance();
}

void LocalEngineProvider::consume(std::span<const int16_t> chunk) {
    if (ended_.load() || chunk.empty()) return;

    double energy = 0.0;
    for (int16_t s : chunk) {
        energy += static_cast<double>(s) * s;
    }
    double rms = std::sqrt(energy / static_cast<double>(chunk.size()));

    utterance_.insert(utterance_.end(), chunk.begin(), chunk.end());

    if (rms >= settings_.silence_threshold) {
        voiced_ = true;
        trailing_silence_ = 0;
    } else {
        trailing_silence_ += chunk.size();
    }

    if (!voiced_) {
        // Short pre-roll so the first syllable is not clipped.
        size_t keep = ms_to_samples(PRE_ROLL_MS);
        if (utterance_.size() > keep) {
            utterance_.erase(utterance_.begin(),
                             utterance_.begin() + static_cast<ptrdiff_t>(utterance_.size() - keep));
        }
        decoded_size_ = utterance_.size();
        return;
    }

    if (trailing_silence_ >= ms_to_samples(settings_.silence_ms) ||
        utterance_.size() >= ms_to_samples(settings_.max_utterance_ms)) {
        finalize_utterance();
        return;
    }

    if (options_.interim_results &&
        utterance_.size() - decoded_size_ >= ms_to_samples(settings_.step_ms)) {
        decode_interim();
    }
}

void LocalEngineProvider::decode_interim() {
    auto text = decode();
    decoded_size_ = utterance_.size();
    if (text && !text->empty()) {
        emit(TranscriptEvent{sequence_, false, std::move(*text)});
    }
}

void LocalEngineProvider::finalize_utterance() {
    bool voiced = voiced_;
    std::expected<std::string, Error> text = std::string{};
    if (voiced && !ended_.load()) {
        text = decode();
    }

    utterance_.clear();
    voiced_ = false;
    trailing_silence_ = 0;
    decoded_size_ = 0;

    if (!voiced || ended_.load() || !text) return;

    emit(TranscriptEvent{sequence_, true, std::move(*text)});
    ++sequence_;
    if (!options_.continuous) {
        ended_.store(true);
    }
}

std::expected<std::string, Error> LocalEngineProvider::decode() {
    auto result = recognizer_->transcribe(utterance_, options_.sample_rate);

    if (!result) {
        ++failures_;
        if (failures_ >= settings_.max_failures) {
            if (!degraded_.exchange(true)) {
                notice(BackendNotice::Severity::Degraded,
                       Error{result.error().kind,
                             std::to_string(failures_) + " consecutive decode failures: " +
                             result.error().message});
            }
        } else {
            notice(BackendNotice::Severity::Transient, result.error());
        }
        return result;
    }

    failures_ = 0;
    if (degraded_.exchange(false)) {
        notice(BackendNotice::Severity::Restored,
               Error{ErrorKind::BackendConnection, "decoding recovered"});
    }

    auto& text = *result;
    auto start_pos = text.find_first_not_of(" \t\n\r");
    if (start_pos == std::string::npos) {
        text.clear();
    } else {
        auto end_pos = text.find_last_not_of(" \t\n\r");
        text = text.substr(start_pos, end_pos - start_pos + 1);
    }
    return result;
}

void LocalEngineProvider::emit(const ProviderEvent& event) {
    std::lock_guard lock(sink_mutex_);
    if (sink_) sink_(event);
}

void LocalEngineProvider::notice(BackendNotice::Severity severity, Error error) {
    std::println(stderr, "local: {} ({})", error.message, severity_name(severity));
    emit(BackendNotice{severity, std::move(error)});
}
