#include "simplemcp/framer.hpp"
#include "simplemcp/error.hpp"
#include "simplemcp/transport/transport.hpp"
#include <algorithm>
#include <cctype>
#include <string>

namespace simplemcp {

namespace {

constexpr std::string_view kContentLength = "content-length";

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

// Parses the header block (without the terminating blank line) and returns
// the declared body length.
std::size_t parse_content_length(std::string_view headers, std::size_t max_size) {
    std::optional<std::size_t> length;
    while (!headers.empty()) {
        std::size_t eol = headers.find('\n');
        std::string_view line = headers.substr(0, eol);
        headers = eol == std::string_view::npos ? std::string_view{} : headers.substr(eol + 1);
        line = trim(line);
        if (line.empty()) continue;

        std::size_t colon = line.find(':');
        if (colon == std::string_view::npos) {
            throw FramingError("Malformed header line: " + std::string(line));
        }
        if (!iequals(trim(line.substr(0, colon)), kContentLength)) continue;

        std::string_view value = trim(line.substr(colon + 1));
        if (value.empty() || !std::all_of(value.begin(), value.end(),
                                          [](char c) { return std::isdigit(static_cast<unsigned char>(c)); })) {
            throw FramingError("Invalid Content-Length: " + std::string(value));
        }
        if (value.size() > 19) {
            throw FramingError("Content-Length too large");
        }
        length = std::stoull(std::string(value));
    }
    if (!length) {
        throw FramingError("Missing Content-Length header");
    }
    if (*length > max_size) {
        throw FramingError("Message of " + std::to_string(*length) +
                           " bytes exceeds limit of " + std::to_string(max_size));
    }
    return *length;
}

} // anonymous namespace

Framer::Framer(FramingMode mode, std::size_t max_message_size)
    : mode_(mode), max_message_size_(max_message_size) {
    buffer_.reserve(4096);
}

void Framer::feed(std::string_view bytes) {
    compact();
    buffer_.append(bytes.data(), bytes.size());
}

void Framer::compact() {
    if (pos_ == 0) return;
    buffer_.erase(0, pos_);
    pos_ = 0;
}

std::optional<std::string_view> Framer::next_line() {
    while (true) {
        std::size_t nl = buffer_.find('\n', pos_);
        if (nl == std::string::npos) {
            if (buffer_.size() - pos_ > max_message_size_) {
                throw FramingError("Message exceeds limit of " +
                                   std::to_string(max_message_size_) + " bytes");
            }
            return std::nullopt;
        }

        std::string_view line(buffer_.data() + pos_, nl - pos_);
        pos_ = nl + 1;

        // Remove trailing \r if present (CRLF)
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        if (trim(line).empty()) continue;

        if (line.size() > max_message_size_) {
            throw FramingError("Message exceeds limit of " +
                               std::to_string(max_message_size_) + " bytes");
        }
        return line;
    }
}

std::optional<std::string_view> Framer::next_content_length_body() {
    if (!pending_body_) {
        std::size_t end = buffer_.find("\r\n\r\n", pos_);
        std::size_t sep = 4;
        std::size_t lf_end = buffer_.find("\n\n", pos_);
        if (lf_end != std::string::npos && (end == std::string::npos || lf_end < end)) {
            end = lf_end;
            sep = 2;
        }
        if (end == std::string::npos) {
            // Header blocks are small; anything this large is garbage
            if (buffer_.size() - pos_ > 8192) {
                throw FramingError("Header block too large");
            }
            return std::nullopt;
        }
        std::string_view headers(buffer_.data() + pos_, end - pos_);
        pending_body_ = parse_content_length(headers, max_message_size_);
        pos_ = end + sep;
    }

    if (buffer_.size() - pos_ < *pending_body_) {
        return std::nullopt;
    }
    std::string_view body(buffer_.data() + pos_, *pending_body_);
    pos_ += *pending_body_;
    pending_body_.reset();
    return body;
}

std::optional<nlohmann::json> Framer::next() {
    std::optional<std::string_view> unit = mode_ == FramingMode::NewlineDelimited
        ? next_line()
        : next_content_length_body();
    if (!unit) return std::nullopt;
    return Codec::parse_json(*unit);
}

std::optional<nlohmann::json> Framer::finish() {
    std::string_view rest(buffer_.data() + pos_, buffer_.size() - pos_);
    if (!pending_body_ && trim(rest).empty()) {
        return std::nullopt;
    }

    std::size_t n = rest.size();
    std::optional<nlohmann::json> last;
    if (mode_ == FramingMode::NewlineDelimited && n <= max_message_size_) {
        try {
            last = Codec::parse_json(trim(rest));
        } catch (const FramingError&) {
            // Not a whole value; reported as truncation below
        }
    }
    buffer_.clear();
    pos_ = 0;
    pending_body_.reset();
    if (!last) {
        throw UnexpectedEofError("Stream closed with " + std::to_string(n) +
                                 " bytes of an incomplete message");
    }
    return last;
}

std::string Framer::encode(const JsonRpcMessage& msg) const {
    std::string body = Codec::serialize(msg);
    if (mode_ == FramingMode::NewlineDelimited) {
        // serialize() escapes control characters, so the body has no raw newline
        body += '\n';
        return body;
    }
    std::string unit = "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n";
    unit += body;
    return unit;
}

FrameWriter::FrameWriter(ITransport& transport, const Framer& framer)
    : transport_(transport), framer_(framer) {}

void FrameWriter::write(const JsonRpcMessage& msg) {
    std::string unit = framer_.encode(msg);
    std::lock_guard<std::mutex> lock(mutex_);
    transport_.write_chunk(unit);
}

} // namespace simplemcp
