#pragma once

#include <chrono>
#include <expected>
#include <optional>
#include <string>
#include <vector>

struct ProcessOptions {
    // Written to the child's stdin, which is then closed. Without it stdin is /dev/null.
    std::optional<std::string> input;
    // The child is killed once this passes. Zero waits forever.
    std::chrono::milliseconds timeout{0};
};

// Runs argv[0] from PATH with stdout and stderr on /dev/null. Fails when the
// program cannot be started, times out or exits with a non-zero status.
// With input set, the caller must ignore SIGPIPE; the child gets the default.
std::expected<void, std::string> run_process(const std::vector<std::string>& argv,
                                             const ProcessOptions& options = {});
