#pragma once
#include "types.hpp"
#include <mutex>
#include <optional>
#include <string>

namespace simplemcp {

enum class SessionState {
    Uninitialized,
    Initialized,
    Closed
};

const char* to_string(SessionState state);

/// Lifetime of one client connection, from handshake to close.
///
/// Uninitialized -> Initialized after a successful initialize request,
/// -> Closed when the serving loop ends. Closed is terminal.
class Session {
public:
    explicit Session(Implementation server_info);

    SessionState state() const;
    bool is_initialized() const { return state() == SessionState::Initialized; }

    /// Record the handshake. Throws McpProtocolError(InvalidRequest) if the
    /// session is not Uninitialized.
    void mark_initialized(std::optional<Implementation> client_info,
                          std::string protocol_version,
                          nlohmann::json client_capabilities = nlohmann::json::object());

    /// Move to Closed. Idempotent.
    void close();

    const Implementation& server_info() const { return server_info_; }
    std::optional<Implementation> client_info() const;
    std::string protocol_version() const;
    nlohmann::json client_capabilities() const;

private:
    mutable std::mutex mutex_;
    SessionState state_{SessionState::Uninitialized};
    const Implementation server_info_;
    std::optional<Implementation> client_info_;
    std::string protocol_version_;
    nlohmann::json client_caps_ = nlohmann::json::object();
};

} // namespace simplemcp
