#pragma once

#include <expected>
#include <string>

namespace platform {

// Detaches from the controlling terminal with a double fork. Only the final
// daemon process returns. The umask keeps autosaved audio private.
std::expected<void, std::string> daemonize();

} // namespace platform
