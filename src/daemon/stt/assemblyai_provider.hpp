#pragma once

#include "streaming_provider.hpp"

#include <functional>
#include <optional>
#include <string>

// AssemblyAI realtime transcription. Each streaming session is authorized
// with a short-lived token; pause terminates the session and resume opens a
// new one.
class AssemblyAIProvider : public StreamingProvider {
public:
    // (api_key, token_url) -> temporary token
    using TokenSource = std::function<std::expected<std::string, Error>(
        const std::string& api_key, const std::string& token_url)>;

    AssemblyAIProvider(std::optional<std::string> api_key, TransportFactory transport_factory,
                       StreamingSettings settings = {}, TokenSource token_source = {});
    ~AssemblyAIProvider() override;

    ProviderType type() const override { return ProviderType::AssemblyAI; }

    static std::expected<std::string, Error> fetch_token(const std::string& api_key,
                                                         const std::string& token_url);

protected:
    std::expected<void, Error> validate(const ProviderOptions& options) override;
    std::expected<Endpoint, Error> endpoint() override;
    ParsedMessage parse_message(const TransportMessage& msg) override;
    PausePolicy pause_policy() const override { return PausePolicy::Reconnect; }
    std::optional<std::string> close_message() const override;

private:
    std::optional<std::string> api_key_;
    TokenSource token_source_;
};
