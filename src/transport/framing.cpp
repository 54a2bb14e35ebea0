#include "llmtools/transport/framing.hpp"
#include "llmtools/error.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <limits>

namespace llmtools {

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

} // anonymous namespace

const char* to_string(FramingMode mode) {
    switch (mode) {
        case FramingMode::RawJson: return "raw-json";
        case FramingMode::Headers: return "headers";
    }
    return "unknown";
}

bool JsonObjectScanner::feed(char c) {
    if (escaped_) {
        escaped_ = false;
        return false;
    }
    if (in_string_) {
        if (c == '\\') {
            escaped_ = true;
        } else if (c == '"') {
            in_string_ = false;
        }
        return false;
    }
    if (c == '"') {
        in_string_ = true;
    } else if (c == '{') {
        ++depth_;
    } else if (c == '}') {
        --depth_;
        return depth_ == 0;
    }
    return false;
}

void JsonObjectScanner::reset() {
    depth_ = 0;
    in_string_ = false;
    escaped_ = false;
}

std::optional<Header> parse_header_line(std::string_view line) {
    auto colon = line.find(':');
    if (colon == std::string_view::npos) return std::nullopt;
    return Header{std::string(trim(line.substr(0, colon))),
                  std::string(trim(line.substr(colon + 1)))};
}

std::size_t content_length(const std::vector<Header>& headers) {
    const std::string* value = nullptr;
    for (const auto& [name, v] : headers) {
        // Last occurrence wins
        if (iequals(name, "Content-Length")) value = &v;
    }
    if (!value) {
        throw McpProtocolError(error::ParseError, "Missing Content-Length header");
    }

    const char* first = value->data();
    const char* last = value->data() + value->size();
    unsigned long long length = 0;
    auto [ptr, ec] = std::from_chars(first, last, length);
    if (value->empty() || ec != std::errc() || ptr != last ||
        length > std::numeric_limits<std::size_t>::max()) {
        throw McpProtocolError(error::ParseError, "Invalid Content-Length: " + *value);
    }
    return static_cast<std::size_t>(length);
}

} // namespace llmtools
