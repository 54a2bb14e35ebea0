#pragma once
#include "transport.hpp"
#include "framing.hpp"
#include "../codec.hpp"
#include <atomic>
#include <mutex>
#include <optional>
#include <string>

namespace llmtools {

/// StdioTransport reads requests from stdin and writes newline-delimited
/// JSON responses to stdout.
///
/// Every read() re-detects the framing: a message starting with '{' is read
/// as a bare JSON object (brace-tracked, no trailing newline needed), any
/// other message as an LSP-style Content-Length frame. Bytes past the end of
/// one message stay buffered for the next read().
class StdioTransport : public ITransport {
public:
    /// Create transport using system stdin/stdout.
    StdioTransport();

    /// Create transport using specified file descriptors (for testing).
    /// The transport takes ownership of both descriptors.
    StdioTransport(int read_fd, int write_fd);

    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    [[nodiscard]] std::optional<JsonRpcRequest> read() override;
    void write(const JsonRpcResponse& resp) override;
    void shutdown() override;
    bool is_connected() const override;

    /// Framing of the most recently read message.
    FramingMode last_framing() const { return last_framing_; }

private:
    bool fill();
    bool peek(char& c);
    bool get(char& c);
    bool read_line(std::string& line);
    std::optional<std::string> read_json_object();
    std::optional<std::string> read_framed_body();
    void write_all(const std::string& data);

    int read_fd_;
    int write_fd_;
    bool owns_fds_;

    std::string buffer_;
    std::size_t pos_ = 0;
    FramingMode last_framing_ = FramingMode::RawJson;

    std::atomic<bool> connected_{true};
    std::atomic<bool> shutdown_requested_{false};

    std::mutex write_mutex_;

    int wakeup_pipe_[2]{-1, -1};  // pipe for waking up a blocked read
};

} // namespace llmtools
