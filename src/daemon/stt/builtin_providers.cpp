#include "builtin_providers.hpp"

#include "assemblyai_provider.hpp"
#include "deepgram_provider.hpp"
#include "local_engine_provider.hpp"
#include "realtime_stt_provider.hpp"
#include "websocket_transport.hpp"

#ifdef LIVE_SCRIBE_HAVE_WHISPER
#include "whisper_recognizer.hpp"
#endif

static constexpr long CONNECT_TIMEOUT_S = 10;

StreamingSettings streaming_settings(const Config& config) {
    return StreamingSettings{
        .max_reconnect_attempts = config.streaming.max_reconnect_attempts,
        .reconnect_backoff = std::chrono::milliseconds(config.streaming.reconnect_backoff_ms),
        .flush_timeout = std::chrono::milliseconds(config.streaming.flush_timeout_ms),
        .keepalive_interval = std::chrono::milliseconds(config.streaming.keepalive_ms),
        .buffer_seconds = config.audio.buffer_seconds,
    };
}

void register_builtin_providers(ProviderRegistry& registry, const Config& config) {
    auto settings = streaming_settings(config);
    TransportFactory websocket = [] {
        return std::make_unique<WebSocketTransport>(CONNECT_TIMEOUT_S);
    };

    registry.register_constructor(ProviderType::Deepgram,
        [=](const ProviderConfig& pc) -> std::unique_ptr<TranscriptionProvider> {
            return std::make_unique<DeepgramProvider>(pc.credential, websocket, settings);
        });

    registry.register_constructor(ProviderType::AssemblyAI,
        [=](const ProviderConfig& pc) -> std::unique_ptr<TranscriptionProvider> {
            return std::make_unique<AssemblyAIProvider>(pc.credential, websocket, settings);
        });

    registry.register_constructor(ProviderType::RealtimeStt,
        [=](const ProviderConfig&) -> std::unique_ptr<TranscriptionProvider> {
            return std::make_unique<RealtimeSttProvider>(websocket, settings);
        });

#ifdef LIVE_SCRIBE_HAVE_WHISPER
    LocalEngineSettings local;
    local.buffer_seconds = config.audio.buffer_seconds;
    registry.register_constructor(ProviderType::Local,
        [=](const ProviderConfig&) -> std::unique_ptr<TranscriptionProvider> {
            return std::make_unique<LocalEngineProvider>(WhisperRecognizer::load, local);
        });
#endif
}
