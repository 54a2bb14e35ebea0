#pragma once
#include <chrono>
#include <string>
#include <vector>

namespace llmtools {

struct ProcessResult {
    // Exit status; 128 + signal number when killed by a signal,
    // 127 when the binary could not be executed.
    int exit_code = -1;
    // stdout and stderr, interleaved as written.
    std::string output;
    bool timed_out = false;
};

/// Run binary with args (no shell), stdin from /dev/null, and collect its
/// combined output. The process group is killed once timeout elapses.
/// Throws McpTransportError if the process cannot be started.
[[nodiscard]] ProcessResult run_process(const std::string& binary,
                                        const std::vector<std::string>& args,
                                        std::chrono::milliseconds timeout);

} // namespace llmtools
