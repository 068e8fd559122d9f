#pragma once

#include "streaming_provider.hpp"

#include <optional>
#include <string>

// Deepgram live transcription over a WebSocket. The connection is held open
// while paused with periodic KeepAlive messages.
class DeepgramProvider : public StreamingProvider {
public:
    DeepgramProvider(std::optional<std::string> api_key, TransportFactory transport_factory,
                     StreamingSettings settings = {});
    ~DeepgramProvider() override;

    ProviderType type() const override { return ProviderType::Deepgram; }

protected:
    std::expected<void, Error> validate(const ProviderOptions& options) override;
    std::expected<Endpoint, Error> endpoint() override;
    ParsedMessage parse_message(const TransportMessage& msg) override;
    PausePolicy pause_policy() const override { return PausePolicy::KeepAlive; }
    std::optional<std::string> close_message() const override;
    std::optional<std::string> keepalive_message() const override;

private:
    std::optional<std::string> api_key_;
};
