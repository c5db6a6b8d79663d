#include "platform/platform_paths.hpp"

#include <cstdlib>
#include <format>
#include <unistd.h>

namespace platform {

namespace {

constexpr const char* kAppDir = "holdscribe";

// Absolute value of an environment variable, or nullptr. The XDG base
// directory rules treat empty and relative values as unset.
const char* absolute_env(const char* name) {
    const char* value = std::getenv(name);
    return value && value[0] == '/' ? value : nullptr;
}

std::string xdg_app_dir(const char* xdg_var, const char* home_relative) {
    if (const char* base = absolute_env(xdg_var)) {
        return std::format("{}/{}", base, kAppDir);
    }
    if (const char* home = absolute_env("HOME")) {
        return std::format("{}/{}/{}", home, home_relative, kAppDir);
    }
    return {};
}

} // namespace

std::string config_dir() {
    return xdg_app_dir("XDG_CONFIG_HOME", ".config");
}

std::string data_dir() {
    return xdg_app_dir("XDG_DATA_HOME", ".local/share");
}

std::string ipc_endpoint() {
    if (const char* explicit_path = std::getenv("HOLDSCRIBE_SOCKET"); explicit_path && *explicit_path) {
        return explicit_path;
    }
    if (const char* runtime = absolute_env("XDG_RUNTIME_DIR")) {
        return std::format("{}/holdscribe.sock", runtime);
    }
    // /tmp is shared, so the name carries the uid.
    return std::format("/tmp/holdscribe-{}.sock", ::getuid());
}

} // namespace platform
