#include "assemblyai_provider.hpp"
#include "http_client.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

static constexpr auto DEFAULT_URL = "wss://api.assemblyai.com/v2/realtime/ws";
static constexpr auto DEFAULT_TOKEN_URL = "https://api.assemblyai.com/v2/realtime/token";

AssemblyAIProvider::AssemblyAIProvider(std::optional<std::string> api_key,
                                       TransportFactory transport_factory,
                                       StreamingSettings settings,
                                       TokenSource token_source)
    : StreamingProvider(std::move(transport_factory), settings),
      api_key_(std::move(api_key)),
      token_source_(token_source ? std::move(token_source) : TokenSource(fetch_token)) {}

AssemblyAIProvider::~AssemblyAIProvider() {
    cleanup();
}

std::expected<std::string, Error> AssemblyAIProvider::fetch_token(const std::string& api_key,
                                                                  const std::string& token_url) {
    auto resp = http_post(token_url,
                          {"Authorization: " + api_key, "Content-Type: application/json"},
                          R"({"expires_in":3600})", 15);
    if (!resp) {
        return std::unexpected(resp.error());
    }
    if (resp->status == 401 || resp->status == 403) {
        return std::unexpected(Error{ErrorKind::Configuration,
            "AssemblyAI rejected the API key (HTTP " + std::to_string(resp->status) + ")"});
    }
    if (resp->status != 200) {
        return std::unexpected(Error{ErrorKind::BackendConnection,
            "AssemblyAI token request failed (HTTP " + std::to_string(resp->status) + ")"});
    }

    try {
        auto j = json::parse(resp->body);
        if (!j.contains("token")) {
            return std::unexpected(Error{ErrorKind::BackendConnection,
                "AssemblyAI token response has no token"});
        }
        return j["token"].get<std::string>();
    } catch (const json::exception& e) {
        return std::unexpected(Error{ErrorKind::BackendConnection,
            std::string("AssemblyAI token parse error: ") + e.what()});
    }
}

std::expected<void, Error> AssemblyAIProvider::validate(const ProviderOptions&) {
    if (!api_key_ || api_key_->empty()) {
        return std::unexpected(Error{ErrorKind::Configuration,
            "API key is required for AssemblyAI provider"});
    }
    return {};
}

std::expected<StreamingProvider::Endpoint, Error> AssemblyAIProvider::endpoint() {
    auto& opts = options();

    auto token = token_source_(*api_key_, opts.extra_or("token_url", DEFAULT_TOKEN_URL));
    if (!token) {
        return std::unexpected(token.error());
    }

    std::string url = opts.extra_or("url", DEFAULT_URL);
    url += "?sample_rate=" + std::to_string(opts.sample_rate);
    url += "&token=" + url_encode(*token);
    return Endpoint{.url = std::move(url), .headers = {}};
}

StreamingProvider::ParsedMessage AssemblyAIProvider::parse_message(const TransportMessage& msg) {
    if (msg.binary) return {};

    try {
        auto j = json::parse(msg.data);

        if (j.contains("error")) {
            return {.kind = ParsedMessage::Kind::ServerError,
                    .text = "AssemblyAI error: " + j["error"].get<std::string>()};
        }

        auto type = j.value("message_type", std::string{});
        if (type == "PartialTranscript" || type == "FinalTranscript") {
            return {.kind = ParsedMessage::Kind::Result,
                    .is_final = type == "FinalTranscript",
                    .text = j.value("text", std::string{})};
        }
        if (type == "SessionTerminated") {
            return {.kind = ParsedMessage::Kind::EndOfStream};
        }
        return {};
    } catch (const json::exception& e) {
        return {.kind = ParsedMessage::Kind::ServerError,
                .text = std::string("AssemblyAI: malformed message: ") + e.what()};
    }
}

std::optional<std::string> AssemblyAIProvider::close_message() const {
    return R"({"terminate_session":true})";
}
