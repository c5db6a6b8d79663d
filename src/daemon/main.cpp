#include "config.hpp"
#include "platform/daemonizer.hpp"
#include "platform/linux/linux_event_loop.hpp"

#include <csignal>
#include <expected>
#include <print>
#include <span>
#include <string>
#include <string_view>

namespace {

constexpr std::string_view kVersion = "0.1.0";

struct DaemonOptions {
    bool foreground = false;
    bool verbose = false;
    bool show_help = false;
    bool show_version = false;
    std::string config_path;
};

void print_usage() {
    std::println("Usage: holdscribe [options]");
    std::println("Hold the hotkey to dictate; the transcript is delivered on release.");
    std::println("Options:");
    std::println("  -f, --foreground    Stay attached to the terminal");
    std::println("  -v, --verbose       Log session and transcription progress to stderr");
    std::println("  -c, --config PATH   Read PATH instead of the XDG config.json");
    std::println("  -V, --version       Print the version");
    std::println("  -h, --help          Show this help");
}

std::expected<DaemonOptions, std::string> parse_args(std::span<char*> args) {
    DaemonOptions opts;
    for (size_t i = 0; i < args.size(); ++i) {
        std::string_view arg = args[i];
        if (arg == "-f" || arg == "--foreground") {
            opts.foreground = true;
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 == args.size()) return std::unexpected(std::string(arg) + " needs a path");
            opts.config_path = args[++i];
        } else if (arg == "-V" || arg == "--version") {
            opts.show_version = true;
        } else if (arg == "-h" || arg == "--help") {
            opts.show_help = true;
        } else {
            return std::unexpected("unknown option: " + std::string(arg));
        }
    }
    return opts;
}

} // namespace

int main(int argc, char* argv[]) {
    auto opts = parse_args(std::span(argv + 1, static_cast<size_t>(argc > 0 ? argc - 1 : 0)));
    if (!opts) {
        std::println(stderr, "holdscribe: {} (try --help)", opts.error());
        return 2;
    }
    if (opts->show_help) {
        print_usage();
        return 0;
    }
    if (opts->show_version) {
        std::println("holdscribe {}", kVersion);
        return 0;
    }

    Config config = opts->config_path.empty() ? Config::load_default()
                                              : Config::load(opts->config_path);
    if (config.backend.type != "command" && config.backend.type != "lan") {
        std::println(stderr, "holdscribe: backend.type must be \"command\" or \"lan\", got \"{}\"",
                     config.backend.type);
        return 1;
    }

    // Errors after this point only reach the terminal in the foreground.
    if (!opts->foreground) {
        if (auto detached = platform::daemonize(); !detached) {
            std::println(stderr, "holdscribe: cannot detach: {}", detached.error());
            return 1;
        }
    } else if (opts->verbose) {
        std::println(stderr, "[holdscribe] {} backend, {}s chunks, hotkey {}+{}",
                     config.backend.type, config.audio.chunk_seconds,
                     config.hotkey.modifier, config.hotkey.key);
    }

    // Helpers that exit before reading all of their stdin surface as write() errors.
    ::signal(SIGPIPE, SIG_IGN);

    LinuxEventLoop loop(std::move(config), opts->verbose);
    if (!loop.init()) {
        std::println(stderr, "holdscribe: startup failed");
        return 1;
    }
    loop.run();
    return 0;
}
