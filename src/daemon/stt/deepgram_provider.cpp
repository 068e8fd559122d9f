#include "deepgram_provider.hpp"
#include "http_client.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

static constexpr auto DEFAULT_URL = "wss://api.deepgram.com/v1/listen";
static constexpr auto DEFAULT_MODEL = "nova-2";

DeepgramProvider::DeepgramProvider(std::optional<std::string> api_key,
                                   TransportFactory transport_factory,
                                   StreamingSettings settings)
    : StreamingProvider(std::move(transport_factory), settings),
      api_key_(std::move(api_key)) {}

DeepgramProvider::~DeepgramProvider() {
    cleanup();
}

std::expected<void, Error> DeepgramProvider::validate(const ProviderOptions&) {
    if (!api_key_ || api_key_->empty()) {
        return std::unexpected(Error{ErrorKind::Configuration,
            "API key is required for Deepgram provider"});
    }
    return {};
}

std::expected<StreamingProvider::Endpoint, Error> DeepgramProvider::endpoint() {
    auto& opts = options();

    std::string url = opts.extra_or("url", DEFAULT_URL);
    url += "?model=" + url_encode(opts.extra_or("model", DEFAULT_MODEL));
    url += "&language=" + url_encode(opts.language);
    url += "&smart_format=true";
    url += std::string("&interim_results=") + (opts.interim_results ? "true" : "false");
    url += "&encoding=linear16";
    url += "&sample_rate=" + std::to_string(opts.sample_rate);
    url += "&channels=1";

    return Endpoint{
        .url = std::move(url),
        .headers = {"Authorization: Token " + *api_key_},
    };
}

StreamingProvider::ParsedMessage DeepgramProvider::parse_message(const TransportMessage& msg) {
    if (msg.binary) return {};

    try {
        auto j = json::parse(msg.data);

        if (j.contains("err_msg")) {
            return {.kind = ParsedMessage::Kind::ServerError,
                    .text = "Deepgram error: " + j["err_msg"].get<std::string>()};
        }
        if (j.value("type", std::string{}) != "Results") {
            return {};
        }

        std::string transcript;
        auto& alts = j["channel"]["alternatives"];
        if (alts.is_array() && !alts.empty()) {
            transcript = alts[0].value("transcript", std::string{});
        }

        return {.kind = ParsedMessage::Kind::Result,
                .is_final = j.value("is_final", false),
                .text = std::move(transcript)};
    } catch (const json::exception& e) {
        return {.kind = ParsedMessage::Kind::ServerError,
                .text = std::string("Deepgram: malformed message: ") + e.what()};
    }
}

std::optional<std::string> DeepgramProvider::close_message() const {
    return R"({"type":"CloseStream"})";
}

std::optional<std::string> DeepgramProvider::keepalive_message() const {
    return R"({"type":"KeepAlive"})";
}
