#pragma once

#include <string>

namespace platform {

// Directory holding config.json, empty if neither XDG_CONFIG_HOME nor HOME is set.
std::string config_dir();

// Window manager IPC socket from $SWAYSOCK, falling back to $I3SOCK.
std::string ipc_socket();

} // namespace platform
