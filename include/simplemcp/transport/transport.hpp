#pragma once
#include <optional>
#include <string>
#include <string_view>

namespace simplemcp {

/// Duplex byte stream the server reads requests from and writes responses to.
class ITransport {
public:
    virtual ~ITransport() = default;

    /// Block until some bytes are available. Returns nullopt at end of
    /// stream or after close(). Throws McpTransportError on I/O failure.
    [[nodiscard]] virtual std::optional<std::string> read_chunk() = 0;

    /// Write all bytes. Throws McpTransportError on failure or when closed.
    virtual void write_chunk(std::string_view bytes) = 0;

    /// Stop the stream: wake a blocked read_chunk() and end the output so
    /// the peer sees end of stream. Idempotent.
    virtual void close() = 0;

    [[nodiscard]] virtual bool is_open() const = 0;
};

} // namespace simplemcp
