#pragma once

#include "transport.hpp"

#include <curl/curl.h>
#include <string>

// WebSocket client on top of libcurl's CONNECT_ONLY websocket API.
class WebSocketTransport : public MessageTransport {
public:
    explicit WebSocketTransport(long connect_timeout_s = 10);
    ~WebSocketTransport() override;

    WebSocketTransport(const WebSocketTransport&) = delete;
    WebSocketTransport& operator=(const WebSocketTransport&) = delete;

    std::expected<void, Error> open(const std::string& url,
                                    const std::vector<std::string>& headers) override;
    std::expected<void, Error> send_text(std::string_view text) override;
    std::expected<void, Error> send_binary(std::span<const uint8_t> data) override;
    std::expected<std::optional<TransportMessage>, Error> receive(int timeout_ms) override;
    void close() override;
    bool is_open() const override { return curl_ != nullptr; }

private:
    std::expected<void, Error> send_frame(const char* data, size_t len, unsigned int flags);
    bool wait_readable(int timeout_ms);

    long connect_timeout_s_;
    CURL* curl_ = nullptr;
    curl_slist* headers_ = nullptr;
    curl_socket_t sock_ = CURL_SOCKET_BAD;
    TransportMessage partial_;
};
