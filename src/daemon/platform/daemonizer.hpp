#pragma once

#include <string>

namespace platform {

// Detaches from the controlling terminal; returns in the grandchild only.
// stderr is appended to log_path, or discarded when it is empty or cannot
// be opened.
void daemonize(const std::string& log_path);

} // namespace platform
