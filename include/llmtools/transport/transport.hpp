#pragma once
#include "../json_rpc.hpp"
#include <optional>

namespace llmtools {

/// Abstract request/response transport. Pull-based: the server loop asks
/// for one request at a time and writes its response before the next read.
class ITransport {
public:
    virtual ~ITransport() = default;

    /// Block until the next complete request is available.
    /// Returns std::nullopt at end-of-stream or after shutdown().
    /// Throws McpProtocolError when a message cannot be framed, parsed or
    /// validated; the stream stays usable for the following message.
    [[nodiscard]] virtual std::optional<JsonRpcRequest> read() = 0;

    /// Write one response to the peer.
    virtual void write(const JsonRpcResponse& resp) = 0;

    /// Wake a blocked read(). Writes still go through.
    virtual void shutdown() = 0;

    [[nodiscard]] virtual bool is_connected() const = 0;
};

} // namespace llmtools
