#include <mcp_proxy/net/connection.hpp>

#include <mcp_proxy/core/log.hpp>

#include <array>

namespace mcp_proxy {

namespace {

constexpr size_t kReadChunkBytes = 8192;

} // anonymous namespace

Connection::Connection(std::unique_ptr<IByteStream> stream)
    : stream_(std::move(stream)), peer_(stream_->Describe()) {}

Connection::~Connection() {
    Close();
}

ReadResult Connection::ReadMessage() {
    std::array<char, kReadChunkBytes> chunk{};

    while (true) {
        if (auto line = framer_.NextLine()) {
            auto decoded = DecodeLine(*line);
            if (decoded.IsErr()) {
                return ReadResult{ReadResult::Status::Malformed, nullptr,
                                  decoded.Error().message};
            }
            return ReadResult{ReadResult::Status::Message,
                              std::move(decoded).Value(), {}};
        }

        if (eof_ || closed_.load()) {
            if (framer_.Pending() > 0) {
                LogDebug("connection", peer_ + ": dropping " +
                                           std::to_string(framer_.Pending()) +
                                           " bytes of unterminated input");
            }
            return ReadResult{ReadResult::Status::EndOfStream, nullptr, {}};
        }

        auto n = stream_->Read(chunk.data(), chunk.size());
        if (n.IsErr()) {
            return ReadResult{ReadResult::Status::TransportError, nullptr,
                              n.Error().ToString()};
        }
        if (n.Value() == 0) {
            eof_ = true;
            continue;
        }

        auto fed = framer_.Feed(std::string_view(chunk.data(), n.Value()));
        if (fed.IsErr()) {
            return ReadResult{ReadResult::Status::Malformed, nullptr,
                              fed.Error().message};
        }
    }
}

Result<void, Error> Connection::SendMessage(const nlohmann::json& message) {
    const auto line = EncodeLine(message);

    std::lock_guard<std::mutex> lock(send_mutex_);
    if (closed_.load()) {
        return Result<void, Error>::Err(
            Error::Transport("SendMessage", peer_, "connection is closed"));
    }
    return stream_->WriteAll(line);
}

void Connection::ShutdownRead() {
    stream_->ShutdownRead();
}

void Connection::Close() {
    if (closed_.exchange(true)) {
        return;
    }
    // Also fails a send blocked on a full socket buffer.
    stream_->Close();
}

} // namespace mcp_proxy
