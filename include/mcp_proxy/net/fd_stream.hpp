#pragma once

#include <mcp_proxy/net/i_byte_stream.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace mcp_proxy {

// ---------------------------------------------------------------------------
// FdStream — IByteStream over POSIX file descriptors.
//
// Sockets use one fd for both directions; stdio uses 0 for reading and 1 for
// writing. Read() polls in short ticks so Close() from another thread always
// unblocks it, even on a pipe or tty where shutdown() is unavailable.
//
// With a write timeout set, WriteAll() on a socket gives up once the peer has
// not drained its buffer for that long. Pipes ignore the timeout.
// ---------------------------------------------------------------------------
class FdStream : public IByteStream {
    // Restricts construction to the factories below.
    struct Private {
        explicit Private() = default;
    };

public:
    enum class Kind { Socket, Pipe };

    // Takes ownership of socket_fd.
    static std::unique_ptr<FdStream> FromSocket(int socket_fd, std::string peer);

    // Borrows fds 0 and 1; they are not closed on destruction.
    static std::unique_ptr<FdStream> Stdio();

    // Borrows arbitrary read/write fds (used by tests with pipes).
    static std::unique_ptr<FdStream> FromPipes(int read_fd, int write_fd,
                                               std::string name);

    FdStream(Private, Kind kind, int read_fd, int write_fd, bool owns_fds,
             std::string peer);
    ~FdStream() override;

    // 0 (the default) means no limit.
    void SetWriteTimeout(std::chrono::milliseconds timeout) noexcept {
        write_timeout_ = timeout;
    }

    [[nodiscard]] Result<size_t, Error> Read(char* buffer, size_t capacity) override;
    [[nodiscard]] Result<void, Error> WriteAll(std::string_view bytes) override;
    void ShutdownRead() override;
    void Close() override;
    [[nodiscard]] std::string Describe() const override { return peer_; }

private:
    Kind kind_;
    int read_fd_;
    int write_fd_;
    bool owns_fds_;
    std::string peer_;
    std::chrono::milliseconds write_timeout_{0};
    std::atomic<bool> read_shutdown_{false};
    std::atomic<bool> closed_{false};
};

// ---------------------------------------------------------------------------
// TcpListener — listening socket for application connections.
// ---------------------------------------------------------------------------
class TcpListener {
    struct Private {
        explicit Private() = default;
    };

public:
    // Bind and listen. Port 0 picks an ephemeral port (see Port()).
    static Result<std::unique_ptr<TcpListener>, Error> Bind(const std::string& host,
                                                            uint16_t port,
                                                            int backlog = 64);
    TcpListener(Private, int fd, std::string host, uint16_t port);
    ~TcpListener();

    TcpListener(const TcpListener&) = delete;
    TcpListener& operator=(const TcpListener&) = delete;

    // Wait up to timeout for one connection. Ok(nullptr) on timeout or after
    // Close(); Err on a failed accept.
    [[nodiscard]] Result<std::unique_ptr<FdStream>, Error> Accept(
        std::chrono::milliseconds timeout);

    [[nodiscard]] uint16_t Port() const noexcept { return port_; }
    [[nodiscard]] const std::string& Host() const noexcept { return host_; }

    void Close();

private:
    std::atomic<int> fd_;
    std::string host_;
    uint16_t port_;
};

// Blocking client-side connect, optionally bounded by timeout.
[[nodiscard]] Result<std::unique_ptr<FdStream>, Error> TcpConnect(
    const std::string& host, uint16_t port,
    std::chrono::milliseconds timeout = std::chrono::milliseconds(5000));

} // namespace mcp_proxy
