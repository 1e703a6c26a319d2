#pragma once
#include "codec.hpp"
#include "json_rpc.hpp"
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace simplemcp {

class ITransport;

enum class FramingMode {
    /// One JSON value per line; the line feed is the delimiter.
    NewlineDelimited,
    /// "Content-Length: N" header block, blank line, then N bytes of JSON.
    ContentLength
};

constexpr std::size_t DEFAULT_MAX_MESSAGE_SIZE = 4 * 1024 * 1024;

/// Splits an incoming byte stream into complete JSON values and encodes
/// outgoing messages into delimited units.
///
/// Bytes are pushed with feed() in whatever chunks the transport produced;
/// next() pulls the next complete value, buffering partial units across
/// chunk boundaries. Not thread-safe; one reader owns a Framer.
class Framer {
public:
    explicit Framer(FramingMode mode = FramingMode::NewlineDelimited,
                    std::size_t max_message_size = DEFAULT_MAX_MESSAGE_SIZE);

    /// Append raw bytes from the stream.
    void feed(std::string_view bytes);

    /// Next complete JSON value, or nullopt if more bytes are needed.
    /// Throws FramingError on an invalid or oversized unit. After a
    /// FramingError the stream position is undefined; callers stop reading.
    [[nodiscard]] std::optional<nlohmann::json> next();

    /// Signal end of stream. In newline mode a final value that is complete
    /// but lacks its line feed is returned. Throws UnexpectedEofError if a
    /// partial unit is still buffered.
    [[nodiscard]] std::optional<nlohmann::json> finish();

    /// Encode one message as a single delimited unit.
    [[nodiscard]] std::string encode(const JsonRpcMessage& msg) const;

    [[nodiscard]] FramingMode mode() const { return mode_; }
    [[nodiscard]] std::size_t buffered() const { return buffer_.size() - pos_; }

private:
    std::optional<std::string_view> next_line();
    std::optional<std::string_view> next_content_length_body();
    void compact();

    FramingMode mode_;
    std::size_t max_message_size_;
    std::string buffer_;
    std::size_t pos_{0};
    // Content-Length mode: body size once the header block has been read
    std::optional<std::size_t> pending_body_;
};

/// Serializes writes of encoded units to a transport so that concurrent
/// writers never interleave the bytes of two messages.
class FrameWriter {
public:
    FrameWriter(ITransport& transport, const Framer& framer);

    void write(const JsonRpcMessage& msg);

private:
    ITransport& transport_;
    const Framer& framer_;
    std::mutex mutex_;
};

} // namespace simplemcp
