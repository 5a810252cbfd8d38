#pragma once

#include <mcp_proxy/net/i_byte_stream.hpp>

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mcp_proxy {
namespace testing {

// ---------------------------------------------------------------------------
// MockByteStream — in-memory IByteStream for offline tests.
//
// Usage:
//   auto stream = std::make_unique<MockByteStream>("mock-peer");
//   auto* mock = stream.get();
//   mock->EnqueueRead("{\"type\":\"reg");
//   mock->EnqueueRead("ister\"}\n");
//   mock->EnqueueEof();
//   Connection connection(std::move(stream));
//
// Each enqueued chunk is returned by exactly one Read(), so tests control how
// messages are split across reads. With the queue empty, Read() blocks until
// more input, EOF or Close(). Writes are recorded.
// ---------------------------------------------------------------------------
class MockByteStream : public IByteStream {
public:
    explicit MockByteStream(std::string peer = "mock") : peer_(std::move(peer)) {}

    // -- Scripting ----------------------------------------------------------

    void EnqueueRead(std::string chunk) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            reads_.push_back(Scripted{std::move(chunk), std::nullopt});
        }
        cv_.notify_all();
    }

    void EnqueueReadError(std::string message) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            reads_.push_back(Scripted{{}, Error::Transport("Read", peer_, std::move(message))});
        }
        cv_.notify_all();
    }

    void EnqueueEof() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            eof_ = true;
        }
        cv_.notify_all();
    }

    void FailWrites(std::string message) {
        std::lock_guard<std::mutex> lock(mutex_);
        write_error_ = std::move(message);
    }

    // -- Inspection ---------------------------------------------------------

    [[nodiscard]] std::vector<std::string> Writes() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return writes_;
    }

    [[nodiscard]] std::string Written() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::string all;
        for (const auto& w : writes_) all += w;
        return all;
    }

    [[nodiscard]] int CloseCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return close_count_;
    }

    // -- IByteStream ----------------------------------------------------------

    Result<size_t, Error> Read(char* buffer, size_t capacity) override {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return !reads_.empty() || eof_ || closed_ || read_shutdown_; });
        if (closed_ || read_shutdown_ || reads_.empty()) {
            return Result<size_t, Error>::Ok(0);
        }
        auto& front = reads_.front();
        if (front.error) {
            auto error = *front.error;
            reads_.pop_front();
            return Result<size_t, Error>::Err(std::move(error));
        }
        auto n = std::min(capacity, front.data.size());
        std::copy(front.data.begin(), front.data.begin() + static_cast<long>(n), buffer);
        front.data.erase(0, n);
        if (front.data.empty()) {
            reads_.pop_front();
        }
        return Result<size_t, Error>::Ok(n);
    }

    Result<void, Error> WriteAll(std::string_view bytes) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (write_error_) {
            return Result<void, Error>::Err(Error::Transport("WriteAll", peer_, *write_error_));
        }
        writes_.emplace_back(bytes);
        return Result<void, Error>::Ok();
    }

    void ShutdownRead() override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            read_shutdown_ = true;
        }
        cv_.notify_all();
    }

    void Close() override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
            ++close_count_;
        }
        cv_.notify_all();
    }

    [[nodiscard]] std::string Describe() const override { return peer_; }

private:
    struct Scripted {
        std::string data;
        std::optional<Error> error;
    };

    std::string peer_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Scripted> reads_;
    std::vector<std::string> writes_;
    std::optional<std::string> write_error_;
    bool eof_ = false;
    bool read_shutdown_ = false;
    bool closed_ = false;
    int close_count_ = 0;
};

} // namespace testing
} // namespace mcp_proxy
