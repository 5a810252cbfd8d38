#pragma once

#include <mcp_proxy/core/result.hpp>
#include <mcp_proxy/net/i_byte_stream.hpp>
#include <mcp_proxy/wire/line_codec.hpp>

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

#include <nlohmann/json.hpp>

namespace mcp_proxy {

// ---------------------------------------------------------------------------
// ReadResult — outcome of Connection::ReadMessage().
//
// Malformed is recoverable: the offending line has been consumed and the
// caller should keep reading. EndOfStream and TransportError are terminal.
// ---------------------------------------------------------------------------
struct ReadResult {
    enum class Status { Message, Malformed, EndOfStream, TransportError };

    Status status = Status::EndOfStream;
    nlohmann::json message;
    std::string error;

    [[nodiscard]] bool IsMessage() const noexcept { return status == Status::Message; }
    [[nodiscard]] bool IsTerminal() const noexcept {
        return status == Status::EndOfStream || status == Status::TransportError;
    }
};

// ---------------------------------------------------------------------------
// Connection — framed JSON messages over one IByteStream.
//
// ReadMessage() must be called from a single reader thread. SendMessage() may
// be called from any thread; whole lines are written under a per-connection
// send lock so concurrent senders never interleave bytes.
// ---------------------------------------------------------------------------
class Connection {
public:
    explicit Connection(std::unique_ptr<IByteStream> stream);
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    [[nodiscard]] ReadResult ReadMessage();

    // Fails with a Transport error once the connection is closed.
    [[nodiscard]] Result<void, Error> SendMessage(const nlohmann::json& message);

    // Ends reading: a blocked ReadMessage() returns EndOfStream. Sends keep
    // working until Close().
    void ShutdownRead();

    // Idempotent. Unblocks a concurrent ReadMessage().
    void Close();

    [[nodiscard]] bool IsClosed() const noexcept { return closed_.load(); }
    [[nodiscard]] const std::string& Peer() const noexcept { return peer_; }

private:
    std::unique_ptr<IByteStream> stream_;
    std::string peer_;
    LineFramer framer_;
    bool eof_ = false;
    std::mutex send_mutex_;
    std::atomic<bool> closed_{false};
};

} // namespace mcp_proxy
