#include "llmtools/session.hpp"

namespace llmtools {

const char* to_string(SessionState s) {
    switch (s) {
        case SessionState::Uninitialized: return "uninitialized";
        case SessionState::Initializing:  return "initializing";
        case SessionState::Ready:         return "ready";
    }
    return "unknown";
}

SessionState Session::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

void Session::set_state(SessionState s) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = s;
}

void Session::begin(const InitializeParams& params) {
    std::lock_guard<std::mutex> lock(mutex_);
    client_protocol_version_ = params.protocol_version;
    client_info_ = params.client_info;
    client_caps_ = params.capabilities;
    state_ = SessionState::Initializing;
}

std::string Session::client_protocol_version() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return client_protocol_version_;
}

std::optional<Implementation> Session::client_info() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return client_info_;
}

nlohmann::json Session::client_capabilities() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return client_caps_;
}

} // namespace llmtools
