#pragma once

#include "../error.hpp"

#include <cstdint>
#include <expected>
#include <functional>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>

enum class ProviderType { Local, Deepgram, AssemblyAI, RealtimeStt };

std::string_view provider_type_name(ProviderType type);
std::optional<ProviderType> parse_provider_type(std::string_view name);

// Opaque credential identity used as the cache key. Never contains the credential.
std::string credential_fingerprint(const std::optional<std::string>& credential);

struct ProviderOptions {
    std::string language = "en-US";
    bool continuous = true;
    bool interim_results = true;
    uint32_t sample_rate = 16000;
    std::map<std::string, std::string> extra;

    std::string extra_or(const std::string& key, const std::string& fallback) const {
        auto it = extra.find(key);
        return it != extra.end() ? it->second : fallback;
    }

    bool operator==(const ProviderOptions&) const = default;
};

struct ProviderConfig {
    ProviderType type = ProviderType::Deepgram;
    std::optional<std::string> credential;
    ProviderOptions options;
};

struct TranscriptEvent {
    uint64_t sequence_index = 0;
    bool is_final = false;
    std::string text;
};

struct BackendNotice {
    enum class Severity {
        Transient, // recovered or recovering internally
        Degraded,  // reconnects exhausted, backend not transcribing
        Restored,  // backend transcribing again after Degraded
        Fatal,     // session cannot continue
    };

    Severity severity = Severity::Transient;
    Error error;
};

std::string_view severity_name(BackendNotice::Severity severity);

using ProviderEvent = std::variant<TranscriptEvent, BackendNotice>;

class TranscriptionProvider {
public:
    using EventSink = std::function<void(const ProviderEvent&)>;

    virtual ~TranscriptionProvider() = default;

    virtual ProviderType type() const = 0;

    virtual std::expected<void, Error> initialize(const ProviderOptions& options) = 0;
    virtual std::expected<void, Error> start() = 0;
    virtual void pause() = 0;
    virtual void resume() = 0;

    // Called on the capture thread; must not block.
    virtual void push_audio(std::span<const int16_t> samples) = 0;

    // Flushes pending final events to the sink before returning.
    virtual void stop() = 0;
    virtual void cleanup() = 0;

    virtual void set_event_sink(EventSink sink) = 0;

    // Samples discarded because the audio ring was full, since initialize().
    virtual uint64_t dropped_samples() const { return 0; }
};
