#include <catch2/catch_test_macros.hpp>

#include <mcp_proxy/client/app_client.hpp>
#include <mcp_proxy/proxy/proxy_server.hpp>

#include <unistd.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <thread>

using namespace mcp_proxy;
using namespace std::chrono_literals;

namespace {

ProxyConfig LoopbackConfig() {
    ProxyConfig config;
    config.bind = BindAddress{"127.0.0.1", 0};
    config.sweep_interval = std::chrono::milliseconds(20);
    config.shutdown_timeout = std::chrono::seconds(3);
    return config;
}

bool WaitUntil(const std::function<bool()>& predicate,
               std::chrono::milliseconds max = std::chrono::milliseconds(5000)) {
    const auto deadline = std::chrono::steady_clock::now() + max;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return predicate();
}

// Runs a ProxyServer on a loopback port with the agent channel on two pipes.
// The test plays the agent through agent_.
class ProxyHarness {
public:
    explicit ProxyHarness(ProxyConfig config = LoopbackConfig()) {
        REQUIRE(::pipe(to_proxy_) == 0);
        REQUIRE(::pipe(from_proxy_) == 0);
        server_ = std::make_unique<ProxyServer>(
            std::move(config), FdStream::FromPipes(to_proxy_[0], from_proxy_[1], "agent"));
        agent_ = std::make_unique<Connection>(
            FdStream::FromPipes(from_proxy_[0], to_proxy_[1], "test-agent"));
        REQUIRE(server_->Start().IsOk());
        runner_ = std::thread([this] { run_ok_ = server_->Run().IsOk(); });
    }

    ~ProxyHarness() {
        Shutdown();
        agent_->Close();
        server_.reset();
        agent_.reset();
        for (int* fd : {&to_proxy_[0], &to_proxy_[1], &from_proxy_[0], &from_proxy_[1]}) {
            if (*fd >= 0) ::close(*fd);
        }
    }

    ProxyHarness(const ProxyHarness&) = delete;
    ProxyHarness& operator=(const ProxyHarness&) = delete;

    void Shutdown() {
        if (runner_.joinable()) {
            server_->RequestStop();
            runner_.join();
        }
    }

    // Agent closes its end of stdin.
    void CloseAgentInput() {
        ::close(to_proxy_[1]);
        to_proxy_[1] = -1;
    }

    void Send(const nlohmann::json& message) {
        REQUIRE(agent_->SendMessage(message).IsOk());
    }

    void SendRaw(const std::string& line) {
        REQUIRE(::write(to_proxy_[1], line.data(), line.size()) ==
                static_cast<ssize_t>(line.size()));
    }

    void Request(const nlohmann::json& id, const std::string& method,
                 const nlohmann::json& params = nlohmann::json::object()) {
        Send({{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", params}});
    }

    void CallTool(const nlohmann::json& id, const std::string& name,
                  const nlohmann::json& arguments = nlohmann::json::object()) {
        Request(id, "tools/call", {{"name", name}, {"arguments", arguments}});
    }

    std::optional<nlohmann::json> NextReply(std::chrono::milliseconds max =
                                                std::chrono::milliseconds(5000)) {
        auto reader = std::async(std::launch::async, [this] { return agent_->ReadMessage(); });
        if (reader.wait_for(max) != std::future_status::ready) {
            agent_->Close();
            reader.wait();
            return std::nullopt;
        }
        auto read = reader.get();
        if (!read.IsMessage()) {
            return std::nullopt;
        }
        return read.message;
    }

    nlohmann::json ListTools() {
        Request("list", "tools/list");
        auto reply = NextReply();
        REQUIRE(reply.has_value());
        return (*reply)["result"]["tools"];
    }

    ProxyServer& Server() { return *server_; }
    uint16_t Port() const { return server_->BoundPort(); }
    bool RunSucceeded() const { return run_ok_.load(); }
    bool IsRunning() const { return runner_.joinable(); }

    void JoinRunner() {
        if (runner_.joinable()) runner_.join();
    }

private:
    int to_proxy_[2] = {-1, -1};
    int from_proxy_[2] = {-1, -1};
    std::unique_ptr<ProxyServer> server_;
    std::unique_ptr<Connection> agent_;
    std::thread runner_;
    std::atomic<bool> run_ok_{false};
};

// An application connected to the harness through a real socket.
class TestApp {
public:
    TestApp(std::string name, LocalToolRegistry tools)
        : client_(std::move(name), std::move(tools)) {}

    ~TestApp() { Stop(); }

    bool Start(uint16_t port) {
        if (client_.Connect("127.0.0.1", port).IsErr()) return false;
        if (client_.Register().IsErr()) return false;
        serving_ = std::thread([this] { serve_ok_ = client_.Serve().IsOk(); });
        return true;
    }

    void Stop() {
        client_.Disconnect();
        if (serving_.joinable()) serving_.join();
    }

    void WaitForServeToEnd() {
        if (serving_.joinable()) serving_.join();
    }

    AppClient& Client() { return client_; }
    bool ServeSucceeded() const { return serve_ok_.load(); }

private:
    AppClient client_;
    std::thread serving_;
    std::atomic<bool> serve_ok_{false};
};

LocalToolRegistry ToolsReturning(const std::string& tool, const std::string& answer) {
    LocalToolRegistry tools;
    tools.Register(tool, tool + " tool", nullptr,
                   [answer](const nlohmann::json&) { return ToolResult::Ok(answer); });
    return tools;
}

LocalToolRegistry SleepyTools(const std::string& tool, std::chrono::milliseconds delay) {
    LocalToolRegistry tools;
    tools.Register(tool, "Sleeps before answering", nullptr,
                   [delay](const nlohmann::json&) {
                       std::this_thread::sleep_for(delay);
                       return ToolResult::Ok("late");
                   });
    return tools;
}

} // anonymous namespace

// ===========================================================================
// Agent channel basics
// ===========================================================================

TEST_CASE("ProxyServer: initialize and empty tools/list", "[proxy][server]") {
    ProxyHarness proxy;
    REQUIRE(proxy.Port() != 0);

    proxy.Request(1, "initialize");
    auto init = proxy.NextReply();
    REQUIRE(init.has_value());
    CHECK((*init)["id"] == 1);
    CHECK((*init)["result"]["serverInfo"]["name"] == "mcp-proxy");

    CHECK(proxy.ListTools() == nlohmann::json::array());
}

TEST_CASE("ProxyServer: malformed agent line gets a parse error", "[proxy][server]") {
    ProxyHarness proxy;
    proxy.SendRaw("{not json\n");
    auto reply = proxy.NextReply();
    REQUIRE(reply.has_value());
    CHECK((*reply)["id"].is_null());
    CHECK((*reply)["error"]["code"] == rpc_error::kParseError);

    // The channel keeps working.
    proxy.Request(2, "ping");
    auto ping = proxy.NextReply();
    REQUIRE(ping.has_value());
    CHECK((*ping)["id"] == 2);
    CHECK((*ping)["result"] == nlohmann::json::object());
}

TEST_CASE("ProxyServer: unknown method", "[proxy][server]") {
    ProxyHarness proxy;
    proxy.Request(3, "prompts/list");
    auto reply = proxy.NextReply();
    REQUIRE(reply.has_value());
    CHECK((*reply)["error"]["code"] == rpc_error::kMethodNotFound);
}

TEST_CASE("ProxyServer: agent EOF ends Run", "[proxy][server]") {
    ProxyHarness proxy;
    proxy.CloseAgentInput();
    proxy.JoinRunner();
    CHECK(proxy.RunSucceeded());
}

// ===========================================================================
// End-to-end tool calls
// ===========================================================================

TEST_CASE("ProxyServer: single app round trip", "[proxy][server]") {
    ProxyHarness proxy;
    TestApp app("Foo", ToolsReturning("Ping", "pong"));
    REQUIRE(app.Start(proxy.Port()));
    REQUIRE(WaitUntil([&] { return proxy.Server().Registry().ConnectedCount() == 1; }));

    auto tools = proxy.ListTools();
    REQUIRE(tools.size() == 1);
    CHECK(tools[0]["name"] == "Ping");
    CHECK(tools[0]["description"] == "Ping tool");

    proxy.CallTool(7, "Ping");
    auto reply = proxy.NextReply();
    REQUIRE(reply.has_value());
    CHECK((*reply)["id"] == 7);
    CHECK((*reply)["result"]["content"][0]["text"] == "pong");
    CHECK(app.Client().HandledInvocations() == 1);
    CHECK(proxy.Server().Calls().PendingCount() == 0);

    app.Stop();
    CHECK(app.ServeSucceeded());
}

TEST_CASE("ProxyServer: conflicting tools are qualified", "[proxy][server]") {
    ProxyHarness proxy;
    TestApp a("A", ToolsReturning("Reset", "A reset"));
    TestApp b("B", ToolsReturning("Reset", "B reset"));
    REQUIRE(a.Start(proxy.Port()));
    REQUIRE(WaitUntil([&] { return proxy.Server().Registry().ConnectedCount() == 1; }));
    REQUIRE(b.Start(proxy.Port()));
    REQUIRE(WaitUntil([&] { return proxy.Server().Registry().ConnectedCount() == 2; }));

    auto tools = proxy.ListTools();
    REQUIRE(tools.size() == 2);
    CHECK(tools[0]["name"] == "A:Reset");
    CHECK(tools[1]["name"] == "B:Reset");

    proxy.CallTool(1, "Reset");
    auto ambiguous = proxy.NextReply();
    REQUIRE(ambiguous.has_value());
    CHECK((*ambiguous)["error"]["code"] == rpc_error::kToolAmbiguous);

    proxy.CallTool(2, "B:Reset");
    auto reply = proxy.NextReply();
    REQUIRE(reply.has_value());
    CHECK((*reply)["result"]["content"][0]["text"] == "B reset");
    CHECK(a.Client().HandledInvocations() == 0);
    CHECK(b.Client().HandledInvocations() == 1);
}

TEST_CASE("ProxyServer: concurrent calls reply out of order", "[proxy][server]") {
    ProxyHarness proxy;
    TestApp slow("Slow", SleepyTools("Crunch", std::chrono::milliseconds(400)));
    TestApp fast("Fast", ToolsReturning("Quick", "done"));
    REQUIRE(slow.Start(proxy.Port()));
    REQUIRE(fast.Start(proxy.Port()));
    REQUIRE(WaitUntil([&] { return proxy.Server().Registry().ConnectedCount() == 2; }));

    proxy.CallTool("slow", "Crunch");
    proxy.CallTool("fast", "Quick");

    auto first = proxy.NextReply();
    auto second = proxy.NextReply();
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    CHECK((*first)["id"] == "fast");
    CHECK((*second)["id"] == "slow");
    CHECK((*second)["result"]["content"][0]["text"] == "late");
}

TEST_CASE("ProxyServer: unanswered call times out", "[proxy][server]") {
    auto config = LoopbackConfig();
    config.call_timeout = std::chrono::milliseconds(150);
    ProxyHarness proxy(config);

    TestApp app("Slowpoke", SleepyTools("Hang", std::chrono::milliseconds(800)));
    REQUIRE(app.Start(proxy.Port()));
    REQUIRE(WaitUntil([&] { return proxy.Server().Registry().ConnectedCount() == 1; }));

    proxy.CallTool(5, "Hang");
    auto reply = proxy.NextReply();
    REQUIRE(reply.has_value());
    CHECK((*reply)["id"] == 5);
    CHECK((*reply)["error"]["code"] == rpc_error::kTimeout);

    // The late answer is dropped; the agent sees nothing more.
    CHECK_FALSE(proxy.NextReply(std::chrono::milliseconds(1200)).has_value());
}

TEST_CASE("ProxyServer: app disconnect fails its pending calls", "[proxy][server]") {
    ProxyHarness proxy;
    TestApp app("Flaky", SleepyTools("Work", std::chrono::milliseconds(500)));
    REQUIRE(app.Start(proxy.Port()));
    REQUIRE(WaitUntil([&] { return proxy.Server().Registry().ConnectedCount() == 1; }));

    proxy.CallTool(9, "Work");
    REQUIRE(WaitUntil([&] { return app.Client().HandledInvocations() == 1; }));
    app.Client().Disconnect();

    auto reply = proxy.NextReply();
    REQUIRE(reply.has_value());
    CHECK((*reply)["id"] == 9);
    CHECK((*reply)["error"]["code"] == rpc_error::kDisconnected);

    REQUIRE(WaitUntil([&] { return proxy.Server().Registry().ConnectedCount() == 0; }));
    CHECK(proxy.ListTools() == nlohmann::json::array());

    proxy.CallTool(10, "Work");
    auto gone = proxy.NextReply();
    REQUIRE(gone.has_value());
    CHECK((*gone)["error"]["code"] == rpc_error::kToolNotFound);
}

TEST_CASE("ProxyServer: an app that stops reading does not stall the agent", "[proxy][server]") {
    auto config = LoopbackConfig();
    config.call_timeout = std::chrono::milliseconds(1000);
    ProxyHarness proxy(config);

    // Registers over a raw socket, then never reads another byte.
    auto stream = TcpConnect("127.0.0.1", proxy.Port());
    REQUIRE(stream.IsOk());
    Connection sink(std::move(stream).Value());
    REQUIRE(sink.SendMessage({{"type", "register"},
                              {"appName", "Sink"},
                              {"tools", {{{"name", "Put"},
                                          {"description", "Stores a blob"},
                                          {"inputSchema", {{"type", "object"}}}}}}})
                .IsOk());
    REQUIRE(WaitUntil([&] { return proxy.Server().Registry().ConnectedCount() == 1; }));

    // Enough payload to fill both socket buffers many times over.
    constexpr int kCalls = 16;
    const std::string blob(1024 * 1024, 'b');
    for (int i = 0; i < kCalls; ++i) {
        proxy.CallTool(i, "Put", {{"blob", blob}});
    }
    proxy.Request("after", "tools/list");

    bool listed = false;
    int failed_calls = 0;
    for (int i = 0; i < kCalls + 1; ++i) {
        auto reply = proxy.NextReply(std::chrono::milliseconds(5000));
        REQUIRE(reply.has_value());
        if ((*reply)["id"] == "after") {
            listed = (*reply).contains("result");
            continue;
        }
        const auto code = (*reply)["error"]["code"];
        if (code == rpc_error::kTimeout || code == rpc_error::kDisconnected) {
            ++failed_calls;
        }
    }
    CHECK(listed);
    CHECK(failed_calls == kCalls);

    // The stalled connection is dropped rather than kept half written.
    CHECK(WaitUntil([&] { return proxy.Server().Registry().ConnectedCount() == 0; }));
    sink.Close();
}

TEST_CASE("ProxyServer: connection limit", "[proxy][server]") {
    auto config = LoopbackConfig();
    config.max_connections = 1;
    ProxyHarness proxy(config);

    TestApp first("First", ToolsReturning("One", "1"));
    REQUIRE(first.Start(proxy.Port()));
    REQUIRE(WaitUntil([&] { return proxy.Server().Registry().ConnectedCount() == 1; }));

    TestApp second("Second", ToolsReturning("Two", "2"));
    // TCP connect succeeds; the proxy closes the socket straight away.
    if (second.Start(proxy.Port())) {
        second.WaitForServeToEnd();
    }
    CHECK(proxy.Server().Registry().ConnectedCount() == 1);
    CHECK(proxy.Server().OpenConnections() == 1);

    auto tools = proxy.ListTools();
    REQUIRE(tools.size() == 1);
    CHECK(tools[0]["name"] == "One");
}

TEST_CASE("ProxyServer: shutdown cancels in-flight calls", "[proxy][server]") {
    ProxyHarness proxy;
    TestApp app("Busy", SleepyTools("Long", std::chrono::milliseconds(1500)));
    REQUIRE(app.Start(proxy.Port()));
    REQUIRE(WaitUntil([&] { return proxy.Server().Registry().ConnectedCount() == 1; }));

    proxy.CallTool(11, "Long");
    REQUIRE(WaitUntil([&] { return app.Client().HandledInvocations() == 1; }));
    // Same path as SIGINT: only the stop flag is set.
    proxy.Shutdown();

    auto reply = proxy.NextReply();
    REQUIRE(reply.has_value());
    CHECK((*reply)["id"] == 11);
    CHECK((*reply)["error"]["code"] == rpc_error::kCancelled);
    CHECK(proxy.Server().Calls().PendingCount() == 0);
    CHECK(proxy.Server().OpenConnections() == 0);

    // The app sees the proxy go away.
    app.WaitForServeToEnd();
    CHECK(app.Client().HandledInvocations() == 1);
}

TEST_CASE("ProxyServer: bind failure is reported", "[proxy][server]") {
    ProxyHarness first;
    auto config = LoopbackConfig();
    config.bind.port = first.Port();

    int fds[2];
    REQUIRE(::pipe(fds) == 0);
    {
        ProxyServer second(config, FdStream::FromPipes(fds[0], fds[1], "agent"));
        auto started = second.Start();
        REQUIRE(started.IsErr());
        CHECK(started.Error().category == ErrorCategory::Transport);
    }
    ::close(fds[0]);
    ::close(fds[1]);
}
