#pragma once

#include <string>

namespace platform {

std::string config_dir();
std::string data_dir();
// Daemon log when detached; empty if no data directory can be resolved.
std::string log_path();
// $LIVE_SCRIBE_SOCKET, else the runtime directory, else /tmp.
std::string ipc_endpoint();

} // namespace platform
