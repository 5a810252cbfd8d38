#include <catch2/catch_test_macros.hpp>

#include "mocks/mock_byte_stream.hpp"

#include <mcp_proxy/client/app_client.hpp>
#include <mcp_proxy/net/fd_stream.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace mcp_proxy;
using mcp_proxy::testing::MockByteStream;

namespace {

LocalToolRegistry DemoTools() {
    LocalToolRegistry tools;
    tools.Register("Ping", "Health check", nullptr,
                   [](const nlohmann::json&) { return ToolResult::Ok("pong"); });
    tools.Register("Echo", "Echo a message", nullptr, [](const nlohmann::json& params) {
        if (!params.contains("message")) {
            return ToolResult::Fail("Missing 'message' parameter");
        }
        return ToolResult::Ok(params["message"]);
    });
    return tools;
}

std::string Line(const nlohmann::json& message) {
    return message.dump() + "\n";
}

std::string Invocation(int correlation_id, const std::string& tool,
                       const nlohmann::json& parameters = nlohmann::json::object()) {
    return Line({{"type", "toolInvocation"},
                 {"correlationId", correlation_id},
                 {"tool", tool},
                 {"parameters", parameters}});
}

std::vector<nlohmann::json> Sent(const MockByteStream& mock) {
    std::vector<nlohmann::json> out;
    for (const auto& write : mock.Writes()) {
        out.push_back(nlohmann::json::parse(write));
    }
    return out;
}

// AppClient attached to a MockByteStream.
struct ClientFixture {
    ClientFixture() : client("Demo", DemoTools()) {
        auto stream = std::make_unique<MockByteStream>("proxy");
        mock = stream.get();
        client.Attach(std::move(stream));
    }

    AppClient client;
    MockByteStream* mock = nullptr;
};

} // anonymous namespace

TEST_CASE("AppClient: register sends the catalog", "[client][app]") {
    ClientFixture f;
    REQUIRE(f.client.Register().IsOk());

    auto sent = Sent(*f.mock);
    REQUIRE(sent.size() == 1);
    CHECK(sent[0]["type"] == "register");
    CHECK(sent[0]["appName"] == "Demo");
    REQUIRE(sent[0]["tools"].size() == 2);
    CHECK(sent[0]["tools"][0]["name"] == "Ping");
    CHECK(sent[0]["tools"][0]["inputSchema"] == nlohmann::json{{"type", "object"}});
    CHECK(sent[0]["tools"][1]["name"] == "Echo");
}

TEST_CASE("AppClient: not connected", "[client][app]") {
    AppClient client("Lonely", DemoTools());
    CHECK_FALSE(client.IsConnected());
    CHECK(client.Name() == "Lonely");

    auto registered = client.Register();
    REQUIRE(registered.IsErr());
    CHECK(registered.Error().message == "not connected");
    CHECK(client.Serve().IsErr());

    // Without a connection the new catalog is simply kept.
    CHECK(client.SetTools(LocalToolRegistry{}).IsOk());
}

TEST_CASE("AppClient: serves invocations in order", "[client][app]") {
    ClientFixture f;
    f.mock->EnqueueRead(Invocation(1, "Ping"));
    f.mock->EnqueueRead(Invocation(2, "Echo", {{"message", "hello"}}));
    f.mock->EnqueueRead(Invocation(3, "Echo"));
    f.mock->EnqueueEof();

    REQUIRE(f.client.Serve().IsOk());
    CHECK(f.client.HandledInvocations() == 3);

    auto sent = Sent(*f.mock);
    REQUIRE(sent.size() == 3);
    CHECK(sent[0]["type"] == "toolResponse");
    CHECK(sent[0]["correlationId"] == 1);
    CHECK(sent[0]["result"]["success"] == true);
    CHECK(sent[0]["result"]["data"] == "pong");

    CHECK(sent[1]["correlationId"] == 2);
    CHECK(sent[1]["result"]["data"] == "hello");

    CHECK(sent[2]["correlationId"] == 3);
    CHECK(sent[2]["result"]["success"] == false);
    CHECK(sent[2]["result"]["error"] == "Missing 'message' parameter");
}

TEST_CASE("AppClient: unknown tool gets a failed response", "[client][app]") {
    ClientFixture f;
    f.mock->EnqueueRead(Invocation(7, "Nope", nullptr));
    f.mock->EnqueueEof();

    REQUIRE(f.client.Serve().IsOk());
    auto sent = Sent(*f.mock);
    REQUIRE(sent.size() == 1);
    CHECK(sent[0]["correlationId"] == 7);
    CHECK(sent[0]["result"]["error"] == "Unknown tool: Nope");
}

TEST_CASE("AppClient: ignores unexpected and malformed messages", "[client][app]") {
    ClientFixture f;
    f.mock->EnqueueRead("this is not json\n");
    f.mock->EnqueueRead(Line({{"type", "register"}, {"appName", "Other"}, {"tools", nlohmann::json::array()}}));
    f.mock->EnqueueRead(Line({{"type", "toolInvocation"}, {"tool", "Ping"}}));
    f.mock->EnqueueRead(Invocation(4, "Ping"));
    f.mock->EnqueueEof();

    REQUIRE(f.client.Serve().IsOk());
    auto sent = Sent(*f.mock);
    REQUIRE(sent.size() == 1);
    CHECK(sent[0]["correlationId"] == 4);
}

TEST_CASE("AppClient: transport error ends Serve with an error", "[client][app]") {
    ClientFixture f;
    f.mock->EnqueueReadError("connection reset by peer");
    auto served = f.client.Serve();
    REQUIRE(served.IsErr());
    CHECK(served.Error().category == ErrorCategory::Transport);
}

TEST_CASE("AppClient: SetTools re-registers when connected", "[client][app]") {
    ClientFixture f;
    REQUIRE(f.client.Register().IsOk());

    LocalToolRegistry updated;
    updated.Register("Status", "Current status", nullptr,
                     [](const nlohmann::json&) { return ToolResult::Ok("green"); });
    REQUIRE(f.client.SetTools(std::move(updated)).IsOk());

    auto sent = Sent(*f.mock);
    REQUIRE(sent.size() == 2);
    REQUIRE(sent[1]["tools"].size() == 1);
    CHECK(sent[1]["tools"][0]["name"] == "Status");

    // Invocations now run against the new catalog.
    f.mock->EnqueueRead(Invocation(9, "Status"));
    f.mock->EnqueueRead(Invocation(10, "Ping"));
    f.mock->EnqueueEof();
    REQUIRE(f.client.Serve().IsOk());
    sent = Sent(*f.mock);
    REQUIRE(sent.size() == 4);
    CHECK(sent[2]["result"]["data"] == "green");
    CHECK(sent[3]["result"]["error"] == "Unknown tool: Ping");
}

TEST_CASE("AppClient: Disconnect unblocks Serve", "[client][app]") {
    ClientFixture f;
    CHECK(f.client.IsConnected());

    std::atomic<bool> served_ok{false};
    std::thread serving([&] { served_ok = f.client.Serve().IsOk(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    f.client.Disconnect();
    serving.join();

    CHECK(served_ok);
    CHECK_FALSE(f.client.IsConnected());
    CHECK(f.mock->CloseCount() == 1);
    CHECK(f.client.Register().IsErr());
}

TEST_CASE("AppClient: failed send does not stop serving", "[client][app]") {
    ClientFixture f;
    f.mock->FailWrites("broken pipe");
    f.mock->EnqueueRead(Invocation(1, "Ping"));
    f.mock->EnqueueEof();

    REQUIRE(f.client.Serve().IsOk());
    CHECK(f.client.HandledInvocations() == 1);
    CHECK(f.mock->Writes().empty());
}

TEST_CASE("AppClient: connect to a closed port fails", "[client][app]") {
    // Bind then close to find a port nobody listens on.
    auto listener = TcpListener::Bind("127.0.0.1", 0);
    REQUIRE(listener.IsOk());
    const auto port = listener.Value()->Port();
    listener.Value()->Close();

    AppClient client("Nobody", DemoTools());
    auto connected = client.ConnectWithRetry("127.0.0.1", port, 2,
                                             std::chrono::milliseconds(10));
    REQUIRE(connected.IsErr());
    CHECK(connected.Error().category == ErrorCategory::Transport);
    CHECK_FALSE(client.IsConnected());
}
