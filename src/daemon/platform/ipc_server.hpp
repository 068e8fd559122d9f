#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

class IpcServer {
public:
    virtual ~IpcServer() = default;
    virtual bool start(const std::string& endpoint) = 0;
    virtual void stop() = 0;
    virtual int server_fd() const = 0;
    virtual int accept_client() = 0;
    // Appends every complete line received so far; a line that is not JSON
    // becomes a null value. Returns false once the client has hung up.
    virtual bool read_commands(int client_fd, std::vector<nlohmann::json>& commands) = 0;
    // Writes one newline-terminated message; used for replies and pushed
    // subscription events alike.
    virtual bool send_message(int client_fd, const nlohmann::json& message) = 0;
    virtual void close_client(int client_fd) = 0;
};
