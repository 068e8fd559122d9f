#pragma once

#include "streaming_provider.hpp"

#include <cstdint>
#include <span>
#include <vector>

// Binary frame accepted by a RealtimeSTT server: uint32 little-endian length
// of the JSON metadata, the metadata, then raw PCM16 samples.
std::vector<uint8_t> encode_realtime_stt_frame(uint32_t sample_rate,
                                               std::span<const int16_t> samples);

// Self-hosted RealtimeSTT server. No credential; pause stops sending audio
// and leaves the connection open.
class RealtimeSttProvider : public StreamingProvider {
public:
    explicit RealtimeSttProvider(TransportFactory transport_factory,
                                 StreamingSettings settings = {});
    ~RealtimeSttProvider() override;

    ProviderType type() const override { return ProviderType::RealtimeStt; }

protected:
    std::expected<void, Error> validate(const ProviderOptions& options) override;
    std::expected<Endpoint, Error> endpoint() override;
    ParsedMessage parse_message(const TransportMessage& msg) override;
    PausePolicy pause_policy() const override { return PausePolicy::Idle; }
    std::expected<void, Error> send_audio(MessageTransport& transport,
                                          std::span<const int16_t> samples) override;
};
