#pragma once

#include <mpvipc/log/macros.hpp>

#include <sys/socket.h>
#include <sys/un.h>
#include <poll.h>
#include <unistd.h>
#include <fcntl.h>
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstring>
#include <optional>
#include <string>
#include <string_view>

namespace mpvipc::net {

/// Unix Domain Socket options
struct uds_options {
    int recv_buffer = 0;                      ///< SO_RCVBUF (0 = system default)
    int send_buffer = 0;                      ///< SO_SNDBUF (0 = system default)
    int backlog = 16;                         ///< Listen backlog
    bool unlink_on_bind = true;               ///< Unlink existing socket file before bind
    size_t max_line_length = 16 * 1024 * 1024; ///< Longest accepted inbound line
};

/// Unix socket address wrapper
struct unix_address {
    std::string path;

    unix_address() = default;

    /// Construct from path string
    explicit unix_address(std::string_view p) : path(p) {}

    /// Check that the path fits in sockaddr_un
    bool fits() const noexcept {
        return path.size() < sizeof(sockaddr_un::sun_path);
    }

    /// Convert to sockaddr_un (callers check fits() first)
    struct sockaddr_un to_sockaddr() const {
        struct sockaddr_un sa{};
        sa.sun_family = AF_UNIX;
        std::memcpy(sa.sun_path, path.data(), std::min(path.size(), sizeof(sa.sun_path) - 1));
        return sa;
    }

    /// Get sockaddr length (varies for abstract sockets)
    socklen_t sockaddr_len() const {
        if (path.empty()) {
            return sizeof(sa_family_t);
        }
        if (path[0] == '\0') {
            // Abstract socket: length includes null byte and name
            return static_cast<socklen_t>(offsetof(struct sockaddr_un, sun_path) + path.size());
        }
        // Filesystem socket: include null terminator
        return static_cast<socklen_t>(offsetof(struct sockaddr_un, sun_path) + path.size() + 1);
    }

    /// Check if this is an abstract socket (Linux-specific)
    bool is_abstract() const {
        return !path.empty() && path[0] == '\0';
    }

    /// Create an abstract socket address (Linux-specific)
    static unix_address abstract(std::string_view name) {
        unix_address addr;
        addr.path.reserve(name.size() + 1);
        addr.path.push_back('\0');
        addr.path.append(name);
        return addr;
    }

    /// Parse "@name" as abstract, anything else as a filesystem path
    static unix_address parse(std::string_view text) {
        if (!text.empty() && text[0] == '@') {
            return abstract(text.substr(1));
        }
        return unix_address(text);
    }

    std::string to_string() const {
        if (path.empty()) {
            return "(unnamed)";
        }
        if (path[0] == '\0') {
            return "@" + path.substr(1);  // Convention: @ for abstract
        }
        return path;
    }
};

namespace detail {

inline void apply_buffer_options(int fd, const uds_options& opts) {
    if (opts.recv_buffer > 0) {
        setsockopt(fd, SOL_SOCKET, SO_RCVBUF, &opts.recv_buffer, sizeof(opts.recv_buffer));
    }
    if (opts.send_buffer > 0) {
        setsockopt(fd, SOL_SOCKET, SO_SNDBUF, &opts.send_buffer, sizeof(opts.send_buffer));
    }
}

/// poll() one descriptor, retrying on EINTR until the deadline.
/// @return >0 ready, 0 timeout, <0 error (errno set)
inline int poll_until(int fd, short events, std::chrono::steady_clock::time_point deadline) {
    for (;;) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        int timeout_ms = remaining.count() > 0 ? static_cast<int>(remaining.count()) : 0;
        struct pollfd pfd{fd, events, 0};
        int ret = ::poll(&pfd, 1, timeout_ms);
        if (ret < 0 && errno == EINTR) {
            continue;
        }
        return ret;
    }
}

} // namespace detail

/// Connected Unix Domain Socket stream with blocking I/O.
///
/// The read side (read_line) and the write side (write_all) may be used
/// concurrently from two different threads, one thread per side.
/// shutdown() may be called from any thread and makes both sides fail.
class uds_stream {
public:
    uds_stream() = default;

    /// Take ownership of a connected descriptor
    explicit uds_stream(int fd, const uds_options& opts = {})
        : fd_(fd), max_line_length_(opts.max_line_length) {}

    /// Move constructor
    uds_stream(uds_stream&& other) noexcept
        : fd_(other.fd_)
        , max_line_length_(other.max_line_length_)
        , read_buffer_(std::move(other.read_buffer_))
        , peer_addr_(std::move(other.peer_addr_)) {
        other.fd_ = -1;
    }

    /// Move assignment
    uds_stream& operator=(uds_stream&& other) noexcept {
        if (this != &other) {
            close();
            fd_ = other.fd_;
            max_line_length_ = other.max_line_length_;
            read_buffer_ = std::move(other.read_buffer_);
            peer_addr_ = std::move(other.peer_addr_);
            other.fd_ = -1;
        }
        return *this;
    }

    /// Destructor
    ~uds_stream() {
        close();
    }

    // Non-copyable
    uds_stream(const uds_stream&) = delete;
    uds_stream& operator=(const uds_stream&) = delete;

    /// Check if stream is valid
    bool is_valid() const noexcept { return fd_ >= 0; }

    /// Get the file descriptor
    int fd() const noexcept { return fd_; }

    /// Address this stream was connected to (empty for accepted streams)
    const unix_address& peer_address() const noexcept { return peer_addr_; }

    /// Set peer address (used after connect)
    void set_peer_address(const unix_address& addr) {
        peer_addr_ = addr;
    }

    /// Write the whole buffer, retrying short writes and EINTR.
    /// @return false on error (errno set)
    bool write_all(const void* buffer, size_t length) {
        const auto* ptr = static_cast<const char*>(buffer);
        size_t remaining = length;

        while (remaining > 0) {
            ssize_t n = ::send(fd_, ptr, remaining, MSG_NOSIGNAL);
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                return false;
            }
            ptr += n;
            remaining -= static_cast<size_t>(n);
        }
        return true;
    }

    /// Write string data
    bool write_all(std::string_view data) {
        return write_all(data.data(), data.size());
    }

    /// Read one line terminated by '\n' (delimiter stripped).
    /// @return std::nullopt on EOF (errno = 0), on error (errno set) or when
    ///         the line exceeds max_line_length (errno = EMSGSIZE)
    std::optional<std::string> read_line() {
        size_t scanned = 0;
        for (;;) {
            auto pos = read_buffer_.find('\n', scanned);
            if (pos != std::string::npos && pos <= max_line_length_) {
                std::string line = read_buffer_.substr(0, pos);
                read_buffer_.erase(0, pos + 1);
                return line;
            }
            scanned = read_buffer_.size();
            if (pos != std::string::npos || scanned > max_line_length_) {
                errno = EMSGSIZE;
                return std::nullopt;
            }

            char chunk[4096];
            ssize_t n = ::recv(fd_, chunk, sizeof(chunk), 0);
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                return std::nullopt;
            }
            if (n == 0) {
                errno = 0;
                return std::nullopt;
            }
            read_buffer_.append(chunk, static_cast<size_t>(n));
        }
    }

    /// Shut down both directions; blocked readers and writers return an error
    bool shutdown() noexcept {
        return fd_ >= 0 && ::shutdown(fd_, SHUT_RDWR) == 0;
    }

    /// Close the descriptor
    /// @return false if ::close() reported an error (errno set)
    bool close() noexcept {
        if (fd_ < 0) {
            return true;
        }
        int ret = ::close(fd_);
        fd_ = -1;
        return ret == 0;
    }

private:
    int fd_ = -1;
    size_t max_line_length_ = uds_options{}.max_line_length;
    std::string read_buffer_;
    unix_address peer_addr_;
};

/// Unix Domain Socket listener for accepting connections
class uds_listener {
public:
    /// Create and bind a Unix Domain Socket listener
    /// @param addr Address (path) to bind to
    /// @param opts Socket options
    /// @return UDS listener on success, std::nullopt on error (check errno)
    static std::optional<uds_listener> bind(const unix_address& addr,
                                            const uds_options& opts = {}) {
        if (!addr.fits()) {
            MPVIPC_LOG_ERROR("Unix socket path too long: {} (max {})",
                             addr.path.size(), sizeof(sockaddr_un::sun_path) - 1);
            errno = ENAMETOOLONG;
            return std::nullopt;
        }

        int fd = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
        if (fd < 0) {
            return std::nullopt;
        }

        detail::apply_buffer_options(fd, opts);

        // Unlink existing socket file if requested (only for filesystem sockets)
        if (opts.unlink_on_bind && !addr.is_abstract() && !addr.path.empty()) {
            ::unlink(addr.path.c_str());
        }

        auto sa = addr.to_sockaddr();
        if (::bind(fd, reinterpret_cast<struct sockaddr*>(&sa), addr.sockaddr_len()) < 0 ||
            ::listen(fd, opts.backlog) < 0) {
            int err = errno;
            ::close(fd);
            errno = err;
            return std::nullopt;
        }

        MPVIPC_LOG_DEBUG("UDS listener bound to {}", addr.to_string());

        return uds_listener(fd, addr, opts);
    }

    /// Move constructor
    uds_listener(uds_listener&& other) noexcept
        : fd_(other.fd_)
        , local_addr_(std::move(other.local_addr_))
        , opts_(other.opts_) {
        other.fd_ = -1;
    }

    /// Move assignment
    uds_listener& operator=(uds_listener&& other) noexcept {
        if (this != &other) {
            close();
            fd_ = other.fd_;
            local_addr_ = std::move(other.local_addr_);
            opts_ = other.opts_;
            other.fd_ = -1;
        }
        return *this;
    }

    /// Destructor
    ~uds_listener() {
        close();
    }

    // Non-copyable
    uds_listener(const uds_listener&) = delete;
    uds_listener& operator=(const uds_listener&) = delete;

    /// Check if listener is valid
    bool is_valid() const noexcept { return fd_ >= 0; }

    /// Get local address
    const unix_address& local_address() const noexcept { return local_addr_; }

    /// Accept one connection, waiting at most @p timeout
    /// @return stream on success, std::nullopt on timeout (errno = ETIMEDOUT) or error
    template<typename Rep, typename Period>
    std::optional<uds_stream> accept(std::chrono::duration<Rep, Period> timeout) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        int ready = detail::poll_until(fd_, POLLIN, deadline);
        if (ready == 0) {
            errno = ETIMEDOUT;
            return std::nullopt;
        }
        if (ready < 0) {
            return std::nullopt;
        }

        int client_fd = ::accept4(fd_, nullptr, nullptr, SOCK_CLOEXEC);
        if (client_fd < 0) {
            return std::nullopt;
        }
        MPVIPC_LOG_DEBUG("Accepted UDS connection on {}", local_addr_.to_string());
        return uds_stream(client_fd, opts_);
    }

    /// Close the listener and remove its socket file
    void close() {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;

            if (!local_addr_.is_abstract() && !local_addr_.path.empty()) {
                ::unlink(local_addr_.path.c_str());
            }
        }
    }

private:
    uds_listener(int fd, const unix_address& addr, const uds_options& opts)
        : fd_(fd), local_addr_(addr), opts_(opts) {}

    int fd_ = -1;
    unix_address local_addr_;
    uds_options opts_;
};

/// Connect to a Unix Domain Socket server within @p timeout.
///
/// The connect itself is non-blocking and bounded by poll(); the returned
/// stream is switched back to blocking mode.
/// @return connected stream, or std::nullopt with errno set
///         (ETIMEDOUT when the deadline elapsed)
template<typename Rep, typename Period>
std::optional<uds_stream> uds_connect(const unix_address& addr,
                                      std::chrono::duration<Rep, Period> timeout,
                                      const uds_options& opts = {}) {
    if (!addr.fits()) {
        errno = ENAMETOOLONG;
        return std::nullopt;
    }

    int fd = socket(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        return std::nullopt;
    }
    uds_stream stream(fd, opts);
    detail::apply_buffer_options(fd, opts);

    // Close the descriptor without clobbering errno
    auto fail = [&stream](int err) -> std::optional<uds_stream> {
        stream.close();
        errno = err;
        return std::nullopt;
    };

    auto deadline = std::chrono::steady_clock::now() + timeout;
    auto sa = addr.to_sockaddr();
    int ret = ::connect(fd, reinterpret_cast<struct sockaddr*>(&sa), addr.sockaddr_len());
    if (ret < 0) {
        // EAGAIN on AF_UNIX means the listener's backlog is full
        if (errno != EINPROGRESS) {
            return fail(errno);
        }

        int ready = detail::poll_until(fd, POLLOUT, deadline);
        if (ready == 0) {
            return fail(ETIMEDOUT);
        }
        if (ready < 0) {
            return fail(errno);
        }

        int err = 0;
        socklen_t len = sizeof(err);
        if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) < 0) {
            return fail(errno);
        }
        if (err != 0) {
            return fail(err);
        }
    }

    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0 || fcntl(fd, F_SETFL, flags & ~O_NONBLOCK) < 0) {
        return fail(errno);
    }

    stream.set_peer_address(addr);
    MPVIPC_LOG_DEBUG("Connected to {}", addr.to_string());
    return stream;
}

/// Connect to a Unix Domain Socket server by path
template<typename Rep, typename Period>
std::optional<uds_stream> uds_connect(std::string_view path,
                                      std::chrono::duration<Rep, Period> timeout,
                                      const uds_options& opts = {}) {
    return uds_connect(unix_address::parse(path), timeout, opts);
}

} // namespace mpvipc::net
