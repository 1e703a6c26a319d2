#pragma once
#include "transport.hpp"
#include <atomic>
#include <cstddef>
#include <mutex>

namespace simplemcp {

/// StdioTransport reads from one file descriptor and writes to another,
/// stdin/stdout by default. A blocked read is interrupted by close() through
/// an internal wakeup pipe.
class StdioTransport : public ITransport {
public:
    /// Create transport using system stdin/stdout.
    StdioTransport();

    /// Create transport using specified file descriptors (for testing).
    /// When owns_fds is true the write descriptor is closed by close() and
    /// the read descriptor with the transport.
    StdioTransport(int read_fd, int write_fd, bool owns_fds = true);

    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    std::optional<std::string> read_chunk() override;
    void write_chunk(std::string_view bytes) override;
    void close() override;
    bool is_open() const override;

    void set_chunk_size(std::size_t size) { chunk_size_ = size == 0 ? 1 : size; }

private:
    void release_fds();

    int read_fd_;
    int write_fd_;
    bool owns_fds_;
    std::size_t chunk_size_{4096};

    std::atomic<bool> open_{true};
    std::mutex write_mutex_;

    int wakeup_pipe_[2]{-1, -1};  // written by close() to interrupt poll()
};

} // namespace simplemcp
