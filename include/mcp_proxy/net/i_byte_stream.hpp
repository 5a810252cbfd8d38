#pragma once

#include <mcp_proxy/core/result.hpp>

#include <cstddef>
#include <string>
#include <string_view>

namespace mcp_proxy {

// ---------------------------------------------------------------------------
// IByteStream — abstract duplex byte stream.
//
// Connection depends on this interface rather than on sockets so framing and
// protocol handling can be tested offline with MockByteStream.
//
// Read() blocks until data arrives, the peer closes (returns 0) or Close() is
// called from another thread (returns 0). WriteAll() writes every byte or
// fails. Close() is idempotent and safe to call concurrently with Read().
// ShutdownRead() ends reading only: a blocked Read() returns 0 and later
// writes still go out.
// ---------------------------------------------------------------------------
class IByteStream {
public:
    virtual ~IByteStream() = default;

    IByteStream() = default;
    IByteStream(const IByteStream&) = delete;
    IByteStream& operator=(const IByteStream&) = delete;
    IByteStream(IByteStream&&) = delete;
    IByteStream& operator=(IByteStream&&) = delete;

    [[nodiscard]] virtual Result<size_t, Error> Read(char* buffer, size_t capacity) = 0;
    [[nodiscard]] virtual Result<void, Error> WriteAll(std::string_view bytes) = 0;
    virtual void ShutdownRead() = 0;
    virtual void Close() = 0;

    // Human-readable peer description for logs, e.g. "127.0.0.1:53122".
    [[nodiscard]] virtual std::string Describe() const = 0;
};

} // namespace mcp_proxy
