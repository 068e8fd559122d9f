#include "websocket_transport.hpp"

#include <chrono>
#include <poll.h>
#include <print>

WebSocketTransport::WebSocketTransport(long connect_timeout_s)
    : connect_timeout_s_(connect_timeout_s) {}

WebSocketTransport::~WebSocketTransport() {
    close();
}

std::expected<void, Error> WebSocketTransport::open(const std::string& url,
                                                    const std::vector<std::string>& headers) {
    close();

    curl_ = curl_easy_init();
    if (!curl_) {
        return std::unexpected(Error{ErrorKind::BackendConnection, "curl_easy_init failed"});
    }

    for (auto& h : headers) {
        headers_ = curl_slist_append(headers_, h.c_str());
    }

    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_CONNECT_ONLY, 2L);
    curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT, connect_timeout_s_);
    if (headers_) {
        curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers_);
    }

    CURLcode res = curl_easy_perform(curl_);

    long http_code = 0;
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &http_code);

    if (res != CURLE_OK) {
        auto kind = (http_code == 401 || http_code == 403) ? ErrorKind::Configuration
                                                           : ErrorKind::BackendConnection;
        std::string msg = std::string("websocket connect failed: ") + curl_easy_strerror(res);
        if (http_code != 0) msg += " (HTTP " + std::to_string(http_code) + ")";
        close();
        return std::unexpected(Error{kind, std::move(msg)});
    }

    if (http_code == 401 || http_code == 403) {
        close();
        return std::unexpected(Error{ErrorKind::Configuration,
            "backend rejected credential (HTTP " + std::to_string(http_code) + ")"});
    }

    curl_easy_getinfo(curl_, CURLINFO_ACTIVESOCKET, &sock_);
    if (sock_ == CURL_SOCKET_BAD) {
        close();
        return std::unexpected(Error{ErrorKind::BackendConnection, "websocket has no active socket"});
    }

    partial_ = {};
    return {};
}

std::expected<void, Error> WebSocketTransport::send_text(std::string_view text) {
    return send_frame(text.data(), text.size(), CURLWS_TEXT);
}

std::expected<void, Error> WebSocketTransport::send_binary(std::span<const uint8_t> data) {
    return send_frame(reinterpret_cast<const char*>(data.data()), data.size(), CURLWS_BINARY);
}

std::expected<void, Error> WebSocketTransport::send_frame(const char* data, size_t len,
                                                          unsigned int flags) {
    if (!curl_) {
        return std::unexpected(Error{ErrorKind::BackendConnection, "websocket not open"});
    }

    size_t offset = 0;
    do {
        size_t sent = 0;
        CURLcode res = curl_ws_send(curl_, data + offset, len - offset, &sent, 0, flags);
        if (res == CURLE_AGAIN) {
            pollfd pfd{.fd = sock_, .events = POLLOUT, .revents = 0};
            ::poll(&pfd, 1, 100);
            continue;
        }
        if (res != CURLE_OK) {
            close();
            return std::unexpected(Error{ErrorKind::BackendConnection,
                std::string("websocket send failed: ") + curl_easy_strerror(res)});
        }
        offset += sent;
    } while (offset < len);

    return {};
}

bool WebSocketTransport::wait_readable(int timeout_ms) {
    pollfd pfd{.fd = sock_, .events = POLLIN, .revents = 0};
    return ::poll(&pfd, 1, timeout_ms) > 0;
}

std::expected<std::optional<TransportMessage>, Error>
WebSocketTransport::receive(int timeout_ms) {
    if (!curl_) {
        return std::unexpected(Error{ErrorKind::BackendConnection, "websocket not open"});
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    char buf[16384];

    while (true) {
        size_t n = 0;
        curl_ws_frame* meta = nullptr;
        CURLcode res = curl_ws_recv(curl_, buf, sizeof(buf), &n, &meta);

        if (res == CURLE_AGAIN) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now()).count();
            if (left <= 0 || !wait_readable(static_cast<int>(left))) {
                return std::optional<TransportMessage>{};
            }
            continue;
        }

        if (res != CURLE_OK) {
            close();
            return std::unexpected(Error{ErrorKind::BackendConnection,
                std::string("websocket receive failed: ") + curl_easy_strerror(res)});
        }

        if (!meta) continue;

        if (meta->flags & CURLWS_CLOSE) {
            close();
            return std::unexpected(Error{ErrorKind::BackendConnection, "websocket closed by peer"});
        }
        if (meta->flags & CURLWS_PING) continue;

        if (meta->flags & CURLWS_BINARY) partial_.binary = true;
        partial_.data.append(buf, n);

        if (meta->bytesleft == 0 && !(meta->flags & CURLWS_CONT)) {
            TransportMessage msg = std::move(partial_);
            partial_ = {};
            return std::optional<TransportMessage>(std::move(msg));
        }
    }
}

void WebSocketTransport::close() {
    if (curl_) {
        if (sock_ != CURL_SOCKET_BAD) {
            size_t sent = 0;
            curl_ws_send(curl_, "", 0, &sent, 0, CURLWS_CLOSE);
        }
        curl_easy_cleanup(curl_);
        curl_ = nullptr;
    }
    if (headers_) {
        curl_slist_free_all(headers_);
        headers_ = nullptr;
    }
    sock_ = CURL_SOCKET_BAD;
}
