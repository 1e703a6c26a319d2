#pragma once
#include <stdexcept>
#include <string>

namespace simplemcp {

class McpError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// A complete unit on the wire was not valid JSON, or broke framing rules.
class FramingError : public McpError {
public:
    using McpError::McpError;
};

/// The stream closed while a message was only partially received.
class UnexpectedEofError : public McpError {
public:
    using McpError::McpError;
};

class McpTransportError : public McpError {
public:
    using McpError::McpError;
};

/// Error that maps directly onto a JSON-RPC error object.
class McpProtocolError : public McpError {
public:
    int code;
    McpProtocolError(int code, const std::string& msg)
        : McpError(msg), code(code) {}
};

class InvalidRequestError : public McpProtocolError {
public:
    explicit InvalidRequestError(const std::string& msg);
};

class InvalidParamsError : public McpProtocolError {
public:
    explicit InvalidParamsError(const std::string& msg);
};

class NotFoundError : public McpProtocolError {
public:
    explicit NotFoundError(const std::string& msg);
};

class DuplicateKeyError : public McpError {
public:
    using McpError::McpError;
};

class RegistryFrozenError : public McpError {
public:
    using McpError::McpError;
};

namespace error {
    constexpr int ParseError       = -32700;
    constexpr int InvalidRequest   = -32600;
    constexpr int MethodNotFound   = -32601;
    constexpr int InvalidParams    = -32602;
    constexpr int InternalError    = -32603;
    // Server-defined range
    constexpr int HandlerFailure   = -32000;
    constexpr int NotInitialized   = -32001;
    constexpr int NotFound         = -32002;
} // namespace error

inline InvalidRequestError::InvalidRequestError(const std::string& msg)
    : McpProtocolError(error::InvalidRequest, msg) {}

inline InvalidParamsError::InvalidParamsError(const std::string& msg)
    : McpProtocolError(error::InvalidParams, msg) {}

inline NotFoundError::NotFoundError(const std::string& msg)
    : McpProtocolError(error::NotFound, msg) {}

} // namespace simplemcp
