#include "llmtools/transport/stdio_transport.hpp"
#include "llmtools/error.hpp"
#include "llmtools/log.hpp"
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <vector>

namespace llmtools {

namespace {

constexpr std::size_t kChunkSize = 4096;
constexpr std::size_t kCompactThreshold = 64 * 1024;

} // anonymous namespace

StdioTransport::StdioTransport()
    : StdioTransport(STDIN_FILENO, STDOUT_FILENO) {
    owns_fds_ = false;
}

StdioTransport::StdioTransport(int read_fd, int write_fd)
    : read_fd_(read_fd), write_fd_(write_fd), owns_fds_(true) {
    if (::pipe(wakeup_pipe_) < 0) {
        throw McpTransportError(std::string("Failed to create wakeup pipe: ") + strerror(errno));
    }
    int flags = fcntl(wakeup_pipe_[1], F_GETFL, 0);
    fcntl(wakeup_pipe_[1], F_SETFL, flags | O_NONBLOCK);
    buffer_.reserve(kChunkSize);
}

StdioTransport::~StdioTransport() {
    if (owns_fds_) {
        if (read_fd_ >= 0)  ::close(read_fd_);
        if (write_fd_ >= 0) ::close(write_fd_);
    }
    if (wakeup_pipe_[0] >= 0) ::close(wakeup_pipe_[0]);
    if (wakeup_pipe_[1] >= 0) ::close(wakeup_pipe_[1]);
}

// ---- Input buffering ----

bool StdioTransport::fill() {
    if (pos_ > 0 && pos_ == buffer_.size()) {
        buffer_.clear();
        pos_ = 0;
    } else if (pos_ > kCompactThreshold) {
        buffer_.erase(0, pos_);
        pos_ = 0;
    }

    char chunk[kChunkSize];
    while (!shutdown_requested_) {
        // Use poll() so that shutdown() can interrupt the blocking read
        // via the wakeup pipe.
        struct pollfd fds[2];
        fds[0].fd = read_fd_;
        fds[0].events = POLLIN;
        fds[0].revents = 0;
        fds[1].fd = wakeup_pipe_[0];
        fds[1].events = POLLIN;
        fds[1].revents = 0;

        int ret = ::poll(fds, 2, -1);
        if (ret < 0) {
            if (errno == EINTR) continue;
            throw McpTransportError(std::string("Poll error: ") + strerror(errno));
        }

        // Wakeup pipe has data → shutdown() was called
        if (fds[1].revents & POLLIN) return false;

        if (fds[0].revents & POLLNVAL) {
            throw McpTransportError("Read error: input descriptor is not open");
        }
        if (!(fds[0].revents & (POLLIN | POLLHUP | POLLERR))) continue;

        ssize_t n = ::read(read_fd_, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            throw McpTransportError(std::string("Read error: ") + strerror(errno));
        }
        if (n == 0) {
            connected_ = false;
            return false;
        }
        buffer_.append(chunk, static_cast<std::size_t>(n));
        return true;
    }
    return false;
}

bool StdioTransport::peek(char& c) {
    if (pos_ >= buffer_.size() && !fill()) return false;
    c = buffer_[pos_];
    return true;
}

bool StdioTransport::get(char& c) {
    if (!peek(c)) return false;
    ++pos_;
    return true;
}

bool StdioTransport::read_line(std::string& line) {
    line.clear();
    char c;
    while (get(c)) {
        if (c == '\n') {
            while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
                line.pop_back();
            }
            return true;
        }
        line.push_back(c);
    }
    return false;
}

// ---- Framing ----

std::optional<std::string> StdioTransport::read_json_object() {
    std::string data;
    JsonObjectScanner scanner;
    char c;
    while (get(c)) {
        data.push_back(c);
        if (scanner.feed(c)) return data;
    }
    if (data.empty() || shutdown_requested_) return std::nullopt;
    throw McpProtocolError(error::ParseError, "Unexpected end of stream inside JSON object");
}

std::optional<std::string> StdioTransport::read_framed_body() {
    std::vector<Header> headers;
    std::string line;
    while (true) {
        if (!read_line(line)) {
            if (shutdown_requested_) return std::nullopt;
            throw McpProtocolError(error::ParseError,
                "Failed to read header: unexpected end of stream");
        }
        // Empty line ends the header block
        if (line.empty()) break;
        if (auto header = parse_header_line(line)) {
            headers.push_back(std::move(*header));
        }
    }

    std::size_t length = content_length(headers);
    // Grows with the bytes actually received
    std::string body;
    body.reserve(std::min(length, kChunkSize));
    while (body.size() < length) {
        if (pos_ >= buffer_.size() && !fill()) {
            if (shutdown_requested_) return std::nullopt;
            throw McpProtocolError(error::ParseError,
                "Failed to read message body: expected " + std::to_string(length) +
                " bytes, got " + std::to_string(body.size()));
        }
        std::size_t take = std::min(length - body.size(), buffer_.size() - pos_);
        body.append(buffer_, pos_, take);
        pos_ += take;
    }
    return body;
}

std::optional<JsonRpcRequest> StdioTransport::read() {
    char c;
    // Skip whitespace between messages
    while (true) {
        if (!peek(c)) return std::nullopt;
        if (!is_frame_whitespace(c)) break;
        ++pos_;
    }

    last_framing_ = detect_framing(c);
    std::optional<std::string> data = last_framing_ == FramingMode::RawJson
        ? read_json_object()
        : read_framed_body();
    if (!data) return std::nullopt;

    logger()->trace("read {} bytes ({})", data->size(), to_string(last_framing_));
    return Codec::parse_request(*data);
}

// ---- Output ----

void StdioTransport::write(const JsonRpcResponse& resp) {
    std::string serialized = Codec::serialize(resp);
    serialized += '\n';
    std::lock_guard<std::mutex> lock(write_mutex_);
    write_all(serialized);
}

void StdioTransport::write_all(const std::string& data) {
    const char* p = data.data();
    std::size_t remaining = data.size();
    while (remaining > 0) {
        ssize_t written = ::write(write_fd_, p, remaining);
        if (written < 0) {
            if (errno == EINTR) continue;
            connected_ = false;
            throw McpTransportError(std::string("Write error: ") + strerror(errno));
        }
        p += written;
        remaining -= static_cast<std::size_t>(written);
    }
}

void StdioTransport::shutdown() {
    if (shutdown_requested_.exchange(true)) return;
    // Write to wakeup pipe to interrupt poll() in fill().
    if (wakeup_pipe_[1] >= 0) {
        char b = 1;
        if (::write(wakeup_pipe_[1], &b, 1) < 0 && errno != EAGAIN) {
            logger()->warn("failed to wake stdio reader: {}", strerror(errno));
        }
    }
}

bool StdioTransport::is_connected() const {
    return connected_ && !shutdown_requested_;
}

} // namespace llmtools
