#include "realtime_stt_provider.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

static constexpr auto DEFAULT_URL = "ws://localhost:8012";

std::vector<uint8_t> encode_realtime_stt_frame(uint32_t sample_rate,
                                               std::span<const int16_t> samples) {
    std::string metadata = json{{"sampleRate", sample_rate}}.dump();
    auto meta_len = static_cast<uint32_t>(metadata.size());

    std::vector<uint8_t> frame;
    frame.reserve(4 + metadata.size() + samples.size() * 2);

    for (int i = 0; i < 4; ++i) {
        frame.push_back(static_cast<uint8_t>((meta_len >> (8 * i)) & 0xFF));
    }
    frame.insert(frame.end(), metadata.begin(), metadata.end());
    for (int16_t s : samples) {
        auto u = static_cast<uint16_t>(s);
        frame.push_back(static_cast<uint8_t>(u & 0xFF));
        frame.push_back(static_cast<uint8_t>(u >> 8));
    }
    return frame;
}

RealtimeSttProvider::RealtimeSttProvider(TransportFactory transport_factory,
                                         StreamingSettings settings)
    : StreamingProvider(std::move(transport_factory), settings) {}

RealtimeSttProvider::~RealtimeSttProvider() {
    cleanup();
}

std::expected<void, Error> RealtimeSttProvider::validate(const ProviderOptions& options) {
    auto url = options.extra_or("url", DEFAULT_URL);
    if (!url.starts_with("ws://") && !url.starts_with("wss://")) {
        return std::unexpected(Error{ErrorKind::Configuration,
            "RealtimeSTT url must be a ws:// or wss:// address: " + url});
    }
    return {};
}

std::expected<StreamingProvider::Endpoint, Error> RealtimeSttProvider::endpoint() {
    return Endpoint{.url = options().extra_or("url", DEFAULT_URL), .headers = {}};
}

StreamingProvider::ParsedMessage RealtimeSttProvider::parse_message(const TransportMessage& msg) {
    if (msg.binary) return {};

    try {
        auto j = json::parse(msg.data);
        auto type = j.value("type", std::string{});

        if (type == "realtime") {
            return {.kind = ParsedMessage::Kind::Result,
                    .is_final = false,
                    .text = j.value("text", std::string{})};
        }
        if (type == "fullSentence") {
            return {.kind = ParsedMessage::Kind::Result,
                    .is_final = true,
                    .text = j.value("text", std::string{})};
        }
        return {};
    } catch (const json::exception& e) {
        return {.kind = ParsedMessage::Kind::ServerError,
                .text = std::string("RealtimeSTT: malformed message: ") + e.what()};
    }
}

std::expected<void, Error> RealtimeSttProvider::send_audio(MessageTransport& transport,
                                                           std::span<const int16_t> samples) {
    auto frame = encode_realtime_stt_frame(options().sample_rate, samples);
    return transport.send_binary(frame);
}
