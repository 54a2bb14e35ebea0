#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace llmtools {

/// Message delimiting convention, detected per message.
enum class FramingMode {
    RawJson,   // bare {...}, optionally newline-terminated
    Headers    // LSP-style "Content-Length: N\r\n\r\n" + N bytes
};

using Header = std::pair<std::string, std::string>;

inline bool is_frame_whitespace(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

inline FramingMode detect_framing(char first_byte) {
    return first_byte == '{' ? FramingMode::RawJson : FramingMode::Headers;
}

const char* to_string(FramingMode mode);

/// Finds the end of one JSON object in a byte stream by tracking brace depth
/// outside string literals.
class JsonObjectScanner {
public:
    /// Feed the next byte. Returns true when it closes the outermost object.
    bool feed(char c);

    int depth() const { return depth_; }
    bool in_string() const { return in_string_; }
    void reset();

private:
    int depth_ = 0;
    bool in_string_ = false;
    bool escaped_ = false;
};

/// Split "Name: value" into a trimmed (name, value) pair.
/// Lines without a colon yield std::nullopt.
std::optional<Header> parse_header_line(std::string_view line);

/// Value of the Content-Length header (name compared case-insensitively).
/// Throws McpProtocolError(ParseError) when missing or not a decimal number.
std::size_t content_length(const std::vector<Header>& headers);

} // namespace llmtools
