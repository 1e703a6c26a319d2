#include "simplemcp/transport/stdio_transport.hpp"
#include "simplemcp/error.hpp"
#include "simplemcp/logger.hpp"
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <cstring>
#include <string>
#include <vector>

namespace simplemcp {

namespace {

void create_wakeup_pipe(int (&fds)[2]) {
    if (::pipe(fds) < 0) {
        throw McpTransportError(std::string("Failed to create wakeup pipe: ") + std::strerror(errno));
    }
    for (int fd : fds) {
        int flags = ::fcntl(fd, F_GETFL, 0);
        ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

} // anonymous namespace

StdioTransport::StdioTransport()
    : read_fd_(STDIN_FILENO), write_fd_(STDOUT_FILENO), owns_fds_(false) {
    create_wakeup_pipe(wakeup_pipe_);
}

StdioTransport::StdioTransport(int read_fd, int write_fd, bool owns_fds)
    : read_fd_(read_fd), write_fd_(write_fd), owns_fds_(owns_fds) {
    create_wakeup_pipe(wakeup_pipe_);
}

StdioTransport::~StdioTransport() {
    close();
    // The read descriptor is only released here, never under a concurrent read_chunk()
    release_fds();
    if (wakeup_pipe_[0] >= 0) ::close(wakeup_pipe_[0]);
    if (wakeup_pipe_[1] >= 0) ::close(wakeup_pipe_[1]);
}

std::optional<std::string> StdioTransport::read_chunk() {
    std::vector<char> chunk(chunk_size_);

    while (open_) {
        // poll() so that close() can interrupt the blocking read
        struct pollfd fds[2];
        fds[0].fd = read_fd_;
        fds[0].events = POLLIN;
        fds[0].revents = 0;
        fds[1].fd = wakeup_pipe_[0];
        fds[1].events = POLLIN;
        fds[1].revents = 0;

        int ret = ::poll(fds, 2, -1);
        if (ret < 0) {
            if (errno == EINTR) continue;
            throw McpTransportError(std::string("poll failed: ") + std::strerror(errno));
        }

        // Wakeup pipe has data -> close() was called
        if (fds[1].revents & POLLIN) return std::nullopt;

        if (fds[0].revents & POLLNVAL) {
            throw McpTransportError("Read descriptor is not open");
        }
        if (!(fds[0].revents & (POLLIN | POLLHUP | POLLERR))) continue;

        ssize_t n = ::read(read_fd_, chunk.data(), chunk.size());
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            if (!open_) return std::nullopt;
            throw McpTransportError(std::string("Read error: ") + std::strerror(errno));
        }
        if (n == 0) {
            SIMPLEMCP_LOG_DEBUG("stdio transport: end of input");
            return std::nullopt;
        }
        return std::string(chunk.data(), static_cast<size_t>(n));
    }
    return std::nullopt;
}

void StdioTransport::write_chunk(std::string_view bytes) {
    if (!open_) {
        throw McpTransportError("Transport closed");
    }
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (write_fd_ < 0) {
        throw McpTransportError("Transport closed");
    }
    const char* data = bytes.data();
    size_t remaining = bytes.size();

    while (remaining > 0) {
        ssize_t written = ::write(write_fd_, data, remaining);
        if (written < 0) {
            if (errno == EINTR) continue;
            throw McpTransportError(std::string("Write error: ") + std::strerror(errno));
        }
        data += written;
        remaining -= static_cast<size_t>(written);
    }
}

void StdioTransport::close() {
    if (!open_.exchange(false)) return;
    // Write to wakeup pipe to interrupt poll() in read_chunk().
    if (wakeup_pipe_[1] >= 0) {
        char b = 1;
        ssize_t ignored = ::write(wakeup_pipe_[1], &b, 1);
        (void)ignored;
    }
    // The peer sees end of stream now; the read side may still be polled
    // by a concurrent read_chunk() and waits for the destructor.
    if (owns_fds_ && write_fd_ != read_fd_) {
        std::lock_guard<std::mutex> lock(write_mutex_);
        if (write_fd_ >= 0) {
            ::close(write_fd_);
            write_fd_ = -1;
        }
    }
}

void StdioTransport::release_fds() {
    if (owns_fds_) {
        if (read_fd_ >= 0) ::close(read_fd_);
        if (write_fd_ >= 0 && write_fd_ != read_fd_) ::close(write_fd_);
    }
}

bool StdioTransport::is_open() const {
    return open_;
}

} // namespace simplemcp
