#pragma once

#include "../error.hpp"

#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

struct TransportMessage {
    bool binary = false;
    std::string data;
};

// Message-oriented duplex connection to a streaming backend.
class MessageTransport {
public:
    virtual ~MessageTransport() = default;

    virtual std::expected<void, Error> open(const std::string& url,
                                            const std::vector<std::string>& headers) = 0;
    virtual std::expected<void, Error> send_text(std::string_view text) = 0;
    virtual std::expected<void, Error> send_binary(std::span<const uint8_t> data) = 0;

    // Waits up to timeout_ms for one complete message. nullopt on timeout.
    virtual std::expected<std::optional<TransportMessage>, Error> receive(int timeout_ms) = 0;

    virtual void close() = 0;
    virtual bool is_open() const = 0;
};

using TransportFactory = std::function<std::unique_ptr<MessageTransport>()>;
