#include <mcp_proxy/net/fd_stream.hpp>

#include <algorithm>
#include <cerrno>
#include <cstring>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace mcp_proxy {

namespace {

// Granularity at which a blocked Read() or WriteAll() notices Close().
constexpr int64_t kPollTickMs = 100;

std::string ErrnoText(int err) {
    return std::string(std::strerror(err));
}

std::string DescribePeer(const sockaddr_storage& addr) {
    char host[INET6_ADDRSTRLEN] = {0};
    uint16_t port = 0;
    if (addr.ss_family == AF_INET) {
        const auto* in = reinterpret_cast<const sockaddr_in*>(&addr);
        ::inet_ntop(AF_INET, &in->sin_addr, host, sizeof(host));
        port = ntohs(in->sin_port);
    } else if (addr.ss_family == AF_INET6) {
        const auto* in6 = reinterpret_cast<const sockaddr_in6*>(&addr);
        ::inet_ntop(AF_INET6, &in6->sin6_addr, host, sizeof(host));
        port = ntohs(in6->sin6_port);
    } else {
        return "unknown";
    }
    return std::string(host) + ":" + std::to_string(port);
}

std::string MapHost(const std::string& host) {
    if (host.empty() || host == "localhost") {
        return "127.0.0.1";
    }
    return host;
}

// RAII holder for getaddrinfo results.
struct AddrInfoList {
    addrinfo* head = nullptr;
    ~AddrInfoList() {
        if (head != nullptr) ::freeaddrinfo(head);
    }
};

Result<void, Error> Lookup(const std::string& host, uint16_t port, bool passive,
                           AddrInfoList& out) {
    addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    if (passive) hints.ai_flags = AI_PASSIVE;

    const auto port_str = std::to_string(port);
    const auto mapped = MapHost(host);
    int rc = ::getaddrinfo(mapped.c_str(), port_str.c_str(), &hints, &out.head);
    if (rc != 0 || out.head == nullptr) {
        return Result<void, Error>::Err(Error::Transport(
            "Resolve", host + ":" + port_str, ::gai_strerror(rc)));
    }
    return Result<void, Error>::Ok();
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// FdStream
// ---------------------------------------------------------------------------
FdStream::FdStream(Private, Kind kind, int read_fd, int write_fd, bool owns_fds,
                   std::string peer)
    : kind_(kind), read_fd_(read_fd), write_fd_(write_fd),
      owns_fds_(owns_fds), peer_(std::move(peer)) {}

std::unique_ptr<FdStream> FdStream::FromSocket(int socket_fd, std::string peer) {
    return std::make_unique<FdStream>(Private{}, Kind::Socket, socket_fd, socket_fd, true,
                                      std::move(peer));
}

std::unique_ptr<FdStream> FdStream::Stdio() {
    return std::make_unique<FdStream>(Private{}, Kind::Pipe, STDIN_FILENO, STDOUT_FILENO,
                                      false, "stdio");
}

std::unique_ptr<FdStream> FdStream::FromPipes(int read_fd, int write_fd,
                                              std::string name) {
    return std::make_unique<FdStream>(Private{}, Kind::Pipe, read_fd, write_fd, false,
                                      std::move(name));
}

FdStream::~FdStream() {
    Close();
    if (owns_fds_) {
        ::close(read_fd_);
        if (write_fd_ != read_fd_) {
            ::close(write_fd_);
        }
    }
}

Result<size_t, Error> FdStream::Read(char* buffer, size_t capacity) {
    while (!closed_.load() && !read_shutdown_.load()) {
        pollfd pfd{};
        pfd.fd = read_fd_;
        pfd.events = POLLIN;
        int rc = ::poll(&pfd, 1, static_cast<int>(kPollTickMs));
        if (rc == 0) {
            continue;
        }
        if (rc < 0) {
            if (errno == EINTR) continue;
            return Result<size_t, Error>::Err(
                Error::Transport("Read", peer_, "poll failed: " + ErrnoText(errno)));
        }

        ssize_t n = (kind_ == Kind::Socket)
                        ? ::recv(read_fd_, buffer, capacity, 0)
                        : ::read(read_fd_, buffer, capacity);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            if (closed_.load() || read_shutdown_.load()) break;
            return Result<size_t, Error>::Err(
                Error::Transport("Read", peer_, ErrnoText(errno)));
        }
        return Result<size_t, Error>::Ok(static_cast<size_t>(n));
    }
    return Result<size_t, Error>::Ok(0);
}

Result<void, Error> FdStream::WriteAll(std::string_view bytes) {
    const bool bounded = kind_ == Kind::Socket && write_timeout_.count() > 0;
    const auto deadline = std::chrono::steady_clock::now() + write_timeout_;
    size_t written = 0;
    while (written < bytes.size()) {
        if (closed_.load()) {
            return Result<void, Error>::Err(
                Error::Transport("Write", peer_, "stream is closed"));
        }
        if (bounded) {
            const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (left.count() <= 0) {
                return Result<void, Error>::Err(Error::Transport(
                    "Write", peer_, "peer stopped reading; write timed out after " +
                                        std::to_string(write_timeout_.count()) + "ms"));
            }
            pollfd pfd{};
            pfd.fd = write_fd_;
            pfd.events = POLLOUT;
            int rc = ::poll(&pfd, 1,
                            static_cast<int>(std::min<int64_t>(left.count(), kPollTickMs)));
            if (rc == 0) {
                continue;
            }
            if (rc < 0) {
                if (errno == EINTR) continue;
                return Result<void, Error>::Err(
                    Error::Transport("Write", peer_, "poll failed: " + ErrnoText(errno)));
            }
        }
        const char* data = bytes.data() + written;
        const size_t remaining = bytes.size() - written;
        ssize_t n = (kind_ == Kind::Socket)
                        ? ::send(write_fd_, data, remaining,
                                 MSG_NOSIGNAL | (bounded ? MSG_DONTWAIT : 0))
                        : ::write(write_fd_, data, remaining);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            return Result<void, Error>::Err(
                Error::Transport("Write", peer_, ErrnoText(errno)));
        }
        written += static_cast<size_t>(n);
    }
    return Result<void, Error>::Ok();
}

void FdStream::ShutdownRead() {
    if (read_shutdown_.exchange(true)) {
        return;
    }
    if (kind_ == Kind::Socket) {
        ::shutdown(read_fd_, SHUT_RD);
    }
}

void FdStream::Close() {
    if (closed_.exchange(true)) {
        return;
    }
    // The fds stay open until destruction so a concurrent Read() never sees a
    // recycled descriptor; shutdown() wakes any blocked socket reader at once.
    if (kind_ == Kind::Socket) {
        ::shutdown(read_fd_, SHUT_RDWR);
    }
}

// ---------------------------------------------------------------------------
// TcpListener
// ---------------------------------------------------------------------------
TcpListener::TcpListener(Private, int fd, std::string host, uint16_t port)
    : fd_(fd), host_(std::move(host)), port_(port) {}

TcpListener::~TcpListener() {
    Close();
}

Result<std::unique_ptr<TcpListener>, Error> TcpListener::Bind(const std::string& host,
                                                              uint16_t port,
                                                              int backlog) {
    using R = Result<std::unique_ptr<TcpListener>, Error>;
    const auto endpoint = host + ":" + std::to_string(port);

    AddrInfoList addrs;
    auto lookup = Lookup(host, port, true, addrs);
    if (lookup.IsErr()) {
        return R::Err(std::move(lookup).Error());
    }

    std::string last_error = "no usable address";
    for (addrinfo* ai = addrs.head; ai != nullptr; ai = ai->ai_next) {
        int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
        if (fd < 0) {
            last_error = ErrnoText(errno);
            continue;
        }
        const int one = 1;
        ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

        if (::bind(fd, ai->ai_addr, ai->ai_addrlen) != 0 ||
            ::listen(fd, backlog) != 0) {
            last_error = ErrnoText(errno);
            ::close(fd);
            continue;
        }

        sockaddr_storage bound{};
        socklen_t len = sizeof(bound);
        uint16_t bound_port = port;
        if (::getsockname(fd, reinterpret_cast<sockaddr*>(&bound), &len) == 0) {
            if (bound.ss_family == AF_INET) {
                bound_port = ntohs(reinterpret_cast<sockaddr_in*>(&bound)->sin_port);
            } else if (bound.ss_family == AF_INET6) {
                bound_port = ntohs(reinterpret_cast<sockaddr_in6*>(&bound)->sin6_port);
            }
        }
        return R::Ok(std::make_unique<TcpListener>(Private{}, fd, host, bound_port));
    }
    return R::Err(Error::Transport("Bind", endpoint, last_error));
}

Result<std::unique_ptr<FdStream>, Error> TcpListener::Accept(
    std::chrono::milliseconds timeout) {
    using R = Result<std::unique_ptr<FdStream>, Error>;
    const int fd = fd_.load();
    if (fd < 0) {
        return R::Ok(nullptr);
    }

    pollfd pfd{};
    pfd.fd = fd;
    pfd.events = POLLIN;
    int rc = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (rc == 0 || (rc < 0 && errno == EINTR)) {
        return R::Ok(nullptr);
    }
    if (rc < 0) {
        return R::Err(Error::Transport("Accept", host_, "poll failed: " + ErrnoText(errno)));
    }
    if (fd_.load() < 0 || (pfd.revents & POLLNVAL) != 0) {
        return R::Ok(nullptr);
    }

    sockaddr_storage peer{};
    socklen_t len = sizeof(peer);
    int client = ::accept4(fd, reinterpret_cast<sockaddr*>(&peer), &len, SOCK_CLOEXEC);
    if (client < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR ||
            errno == ECONNABORTED) {
            return R::Ok(nullptr);
        }
        return R::Err(Error::Transport("Accept", host_, ErrnoText(errno)));
    }

    const int one = 1;
    ::setsockopt(client, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
    return R::Ok(FdStream::FromSocket(client, DescribePeer(peer)));
}

void TcpListener::Close() {
    int fd = fd_.exchange(-1);
    if (fd >= 0) {
        ::close(fd);
    }
}

// ---------------------------------------------------------------------------
// TcpConnect
// ---------------------------------------------------------------------------
Result<std::unique_ptr<FdStream>, Error> TcpConnect(const std::string& host,
                                                    uint16_t port,
                                                    std::chrono::milliseconds timeout) {
    using R = Result<std::unique_ptr<FdStream>, Error>;
    const auto endpoint = host + ":" + std::to_string(port);

    AddrInfoList addrs;
    auto lookup = Lookup(host, port, false, addrs);
    if (lookup.IsErr()) {
        return R::Err(std::move(lookup).Error());
    }

    std::string last_error = "no usable address";
    for (addrinfo* ai = addrs.head; ai != nullptr; ai = ai->ai_next) {
        int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
        if (fd < 0) {
            last_error = ErrnoText(errno);
            continue;
        }

        // Connect non-blocking so the timeout applies, then switch back.
        int flags = ::fcntl(fd, F_GETFL, 0);
        ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);

        int rc = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
        if (rc != 0 && errno == EINPROGRESS) {
            pollfd pfd{};
            pfd.fd = fd;
            pfd.events = POLLOUT;
            rc = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
            if (rc == 1) {
                int err = 0;
                socklen_t errlen = sizeof(err);
                ::getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &errlen);
                rc = (err == 0) ? 0 : -1;
                if (err != 0) last_error = ErrnoText(err);
            } else {
                rc = -1;
                last_error = "connect timed out";
            }
        } else if (rc != 0) {
            last_error = ErrnoText(errno);
        }

        if (rc != 0) {
            ::close(fd);
            continue;
        }

        ::fcntl(fd, F_SETFL, flags & ~O_NONBLOCK);
        const int one = 1;
        ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
        return R::Ok(FdStream::FromSocket(fd, endpoint));
    }
    return R::Err(Error::Transport("Connect", endpoint, last_error));
}

} // namespace mcp_proxy
