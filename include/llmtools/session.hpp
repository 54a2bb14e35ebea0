#pragma once
#include "types.hpp"
#include <mutex>
#include <optional>
#include <string>

namespace llmtools {

/// Lifecycle of one client connection. Advisory only: tools/list and
/// tools/call are served in every state.
enum class SessionState {
    Uninitialized,
    Initializing,   // initialize answered
    Ready           // initialized notification received
};

const char* to_string(SessionState s);

/// What the client told us about itself during initialize.
class Session {
public:
    SessionState state() const;
    void set_state(SessionState s);

    /// Record initialize params and move to Initializing.
    void begin(const InitializeParams& params);

    std::string client_protocol_version() const;
    std::optional<Implementation> client_info() const;
    nlohmann::json client_capabilities() const;

private:
    mutable std::mutex mutex_;
    SessionState state_{SessionState::Uninitialized};
    std::string client_protocol_version_;
    std::optional<Implementation> client_info_;
    nlohmann::json client_caps_ = nlohmann::json::object();
};

} // namespace llmtools
