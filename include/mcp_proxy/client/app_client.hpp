#pragma once

#include <mcp_proxy/client/local_tool_registry.hpp>
#include <mcp_proxy/core/result.hpp>
#include <mcp_proxy/net/connection.hpp>
#include <mcp_proxy/net/i_byte_stream.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace mcp_proxy {

// ---------------------------------------------------------------------------
// AppClient — the application side of the proxy protocol.
//
// Typical use:
//   AppClient client("WatchTower", std::move(tools));
//   client.ConnectWithRetry("localhost", 5100, 10, 1s);
//   client.Register();
//   client.Serve();   // blocks until the proxy goes away or Disconnect()
//
// Invocations are handled one at a time in arrival order. SetTools() and
// Disconnect() may be called from another thread while Serve() runs.
// ---------------------------------------------------------------------------
class AppClient {
public:
    AppClient(std::string app_name, LocalToolRegistry tools);
    ~AppClient();

    AppClient(const AppClient&) = delete;
    AppClient& operator=(const AppClient&) = delete;

    [[nodiscard]] Result<void, Error> Connect(
        const std::string& host, uint16_t port,
        std::chrono::milliseconds timeout = std::chrono::milliseconds(5000));

    [[nodiscard]] Result<void, Error> ConnectWithRetry(const std::string& host,
                                                       uint16_t port, int attempts,
                                                       std::chrono::milliseconds interval);

    // Use an already-open stream (pipes, in-memory streams in tests).
    void Attach(std::unique_ptr<IByteStream> stream);

    // Send "register" with the current catalog.
    [[nodiscard]] Result<void, Error> Register();

    // Replace the catalog; re-registers when connected.
    [[nodiscard]] Result<void, Error> SetTools(LocalToolRegistry tools);

    // Serve toolInvocation messages until the connection ends. Ok on a clean
    // close by either side.
    [[nodiscard]] Result<void, Error> Serve();

    void Disconnect();

    [[nodiscard]] bool IsConnected() const;
    [[nodiscard]] const std::string& Name() const noexcept { return app_name_; }
    [[nodiscard]] uint64_t HandledInvocations() const;

private:
    [[nodiscard]] std::shared_ptr<Connection> CurrentConnection() const;
    [[nodiscard]] Result<void, Error> SendRegistration(
        const std::shared_ptr<Connection>& connection) const;
    void HandleMessage(Connection& connection, const nlohmann::json& message);

    const std::string app_name_;

    mutable std::mutex mutex_;
    std::shared_ptr<const LocalToolRegistry> tools_;
    std::shared_ptr<Connection> connection_;
    uint64_t handled_ = 0;
};

} // namespace mcp_proxy
