#pragma once

#include "platform/ipc_client.hpp"

#include <string>

class UnixSocketClient : public IpcClient {
public:
    UnixSocketClient();
    ~UnixSocketClient() override;

    UnixSocketClient(const UnixSocketClient&) = delete;
    UnixSocketClient& operator=(const UnixSocketClient&) = delete;

    bool connect(const std::string& endpoint) override;
    bool send(const nlohmann::json& cmd) override;
    bool recv(nlohmann::json& message, int timeout_ms = 30000) override;
    void close() override;
    bool is_connected() const override { return fd_ >= 0; }

private:
    int fd_ = -1;
    // Received bytes past the last complete message; events can arrive
    // back to back in one read.
    std::string pending_;
};
