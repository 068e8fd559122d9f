#pragma once

#include <nlohmann/json.hpp>
#include <string>

class IpcClient {
public:
    virtual ~IpcClient() = default;
    virtual bool connect(const std::string& endpoint) = 0;
    virtual bool send(const nlohmann::json& cmd) = 0;
    // Next newline-delimited message; a negative timeout waits forever.
    virtual bool recv(nlohmann::json& message, int timeout_ms = 30000) = 0;
    virtual void close() = 0;
    virtual bool is_connected() const = 0;

    // One command, one reply. Subscription events that follow the reply
    // are read with recv().
    bool request(const nlohmann::json& cmd, nlohmann::json& response, int timeout_ms = 30000) {
        return send(cmd) && recv(response, timeout_ms);
    }
};
