#include "simplemcp/session.hpp"
#include "simplemcp/error.hpp"

namespace simplemcp {

const char* to_string(SessionState state) {
    switch (state) {
        case SessionState::Uninitialized: return "uninitialized";
        case SessionState::Initialized:   return "initialized";
        case SessionState::Closed:        return "closed";
    }
    return "unknown";
}

Session::Session(Implementation server_info)
    : server_info_(std::move(server_info)) {}

SessionState Session::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

void Session::mark_initialized(std::optional<Implementation> client_info,
                               std::string protocol_version,
                               nlohmann::json client_capabilities) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != SessionState::Uninitialized) {
        throw McpProtocolError(error::InvalidRequest,
                               std::string("Cannot initialize a session that is ") + to_string(state_));
    }
    client_info_ = std::move(client_info);
    protocol_version_ = std::move(protocol_version);
    client_caps_ = std::move(client_capabilities);
    state_ = SessionState::Initialized;
}

void Session::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = SessionState::Closed;
}

std::optional<Implementation> Session::client_info() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return client_info_;
}

std::string Session::protocol_version() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return protocol_version_;
}

nlohmann::json Session::client_capabilities() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return client_caps_;
}

} // namespace simplemcp
