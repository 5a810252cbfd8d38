#include <catch2/catch_test_macros.hpp>

#include <mcp_proxy/net/connection.hpp>

#include "mocks/mock_byte_stream.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace mcp_proxy;
using mcp_proxy::testing::MockByteStream;

namespace {

struct Fixture {
    Fixture() {
        auto stream = std::make_unique<MockByteStream>("app-peer");
        mock = stream.get();
        connection = std::make_unique<Connection>(std::move(stream));
    }

    MockByteStream* mock = nullptr;
    std::unique_ptr<Connection> connection;
};

} // anonymous namespace

// ===========================================================================
// ReadMessage
// ===========================================================================

TEST_CASE("Connection: message split across reads", "[net][connection]") {
    Fixture f;
    f.mock->EnqueueRead("{\"type\":\"reg");
    f.mock->EnqueueRead("ister\",\"appName\":\"Foo\"}");
    f.mock->EnqueueRead("\n");
    f.mock->EnqueueEof();

    auto read = f.connection->ReadMessage();
    REQUIRE(read.IsMessage());
    CHECK(read.message["appName"] == "Foo");
    CHECK(f.connection->ReadMessage().status == ReadResult::Status::EndOfStream);
}

TEST_CASE("Connection: several messages in one read keep order", "[net][connection]") {
    Fixture f;
    f.mock->EnqueueRead("{\"n\":1}\n{\"n\":2}\n{\"n\":3}\n");
    f.mock->EnqueueEof();

    for (int n = 1; n <= 3; ++n) {
        auto read = f.connection->ReadMessage();
        REQUIRE(read.IsMessage());
        CHECK(read.message["n"] == n);
    }
    CHECK(f.connection->ReadMessage().status == ReadResult::Status::EndOfStream);
}

TEST_CASE("Connection: malformed line is skipped, not fatal", "[net][connection]") {
    Fixture f;
    f.mock->EnqueueRead("{not json}\n{\"ok\":true}\n");
    f.mock->EnqueueEof();

    auto bad = f.connection->ReadMessage();
    CHECK(bad.status == ReadResult::Status::Malformed);
    CHECK_FALSE(bad.IsTerminal());
    CHECK_FALSE(bad.error.empty());

    auto good = f.connection->ReadMessage();
    REQUIRE(good.IsMessage());
    CHECK(good.message["ok"] == true);
}

TEST_CASE("Connection: unterminated tail at EOF is dropped", "[net][connection]") {
    Fixture f;
    f.mock->EnqueueRead("{\"a\":1}\n{\"partial\":");
    f.mock->EnqueueEof();

    REQUIRE(f.connection->ReadMessage().IsMessage());
    CHECK(f.connection->ReadMessage().status == ReadResult::Status::EndOfStream);
}

TEST_CASE("Connection: read error is terminal", "[net][connection]") {
    Fixture f;
    f.mock->EnqueueReadError("connection reset by peer");

    auto read = f.connection->ReadMessage();
    CHECK(read.status == ReadResult::Status::TransportError);
    CHECK(read.IsTerminal());
    CHECK(read.error.find("connection reset by peer") != std::string::npos);
}

TEST_CASE("Connection: Close unblocks a waiting reader", "[net][connection]") {
    Fixture f;
    ReadResult result;
    std::thread reader([&] { result = f.connection->ReadMessage(); });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    f.connection->Close();
    reader.join();

    CHECK(result.status == ReadResult::Status::EndOfStream);
    CHECK(f.connection->IsClosed());
}

TEST_CASE("Connection: ShutdownRead ends reading but keeps sending", "[net][connection]") {
    Fixture f;
    ReadResult result;
    std::thread reader([&] { result = f.connection->ReadMessage(); });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    f.connection->ShutdownRead();
    reader.join();

    CHECK(result.status == ReadResult::Status::EndOfStream);
    CHECK_FALSE(f.connection->IsClosed());
    REQUIRE(f.connection->SendMessage({{"id", 11}}).IsOk());
    CHECK(f.mock->Writes().size() == 1);
    CHECK(f.mock->CloseCount() == 0);
}

// ===========================================================================
// SendMessage / Close
// ===========================================================================

TEST_CASE("Connection: SendMessage writes one compact line", "[net][connection]") {
    Fixture f;
    REQUIRE(f.connection->SendMessage({{"type", "toolInvocation"}, {"correlationId", 1}}).IsOk());

    auto writes = f.mock->Writes();
    REQUIRE(writes.size() == 1);
    CHECK(writes[0] == "{\"correlationId\":1,\"type\":\"toolInvocation\"}\n");
}

TEST_CASE("Connection: concurrent senders never interleave", "[net][connection]") {
    Fixture f;
    constexpr int kThreads = 8;
    constexpr int kPerThread = 50;

    std::atomic<int> failures{0};
    std::vector<std::thread> senders;
    for (int t = 0; t < kThreads; ++t) {
        senders.emplace_back([&f, &failures, t] {
            for (int i = 0; i < kPerThread; ++i) {
                auto sent = f.connection->SendMessage(
                    {{"sender", t}, {"seq", i}, {"pad", std::string(64, 'x')}});
                if (sent.IsErr()) ++failures;
            }
        });
    }
    for (auto& s : senders) {
        s.join();
    }
    CHECK(failures == 0);

    auto writes = f.mock->Writes();
    REQUIRE(writes.size() == kThreads * kPerThread);
    for (const auto& w : writes) {
        CHECK(w.find('\n') == w.size() - 1);
        CHECK_NOTHROW(nlohmann::json::parse(w));
    }
}

TEST_CASE("Connection: send after close fails", "[net][connection]") {
    Fixture f;
    f.connection->Close();
    f.connection->Close();

    auto sent = f.connection->SendMessage({{"x", 1}});
    REQUIRE(sent.IsErr());
    CHECK(sent.Error().category == ErrorCategory::Transport);
    CHECK(sent.Error().endpoint == "app-peer");
    CHECK(f.mock->CloseCount() == 1);
}

TEST_CASE("Connection: write failure is reported", "[net][connection]") {
    Fixture f;
    f.mock->FailWrites("broken pipe");
    auto sent = f.connection->SendMessage({{"x", 1}});
    REQUIRE(sent.IsErr());
    CHECK(sent.Error().message == "broken pipe");
}
