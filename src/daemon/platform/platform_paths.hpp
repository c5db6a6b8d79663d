#pragma once

#include <string>

namespace platform {

// Directory holding config.json. Empty when neither XDG_CONFIG_HOME nor HOME is usable.
std::string config_dir();
// Directory holding history.db and the autosave/ checkpoints.
std::string data_dir();
// Address the daemon listens on and the client connects to. HOLDSCRIBE_SOCKET
// overrides it.
std::string ipc_endpoint();

} // namespace platform
