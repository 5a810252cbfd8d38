#pragma once

#include <mcp_proxy/config/proxy_config.hpp>
#include <mcp_proxy/core/result.hpp>
#include <mcp_proxy/core/types.hpp>
#include <mcp_proxy/net/connection.hpp>
#include <mcp_proxy/net/fd_stream.hpp>
#include <mcp_proxy/proxy/agent_handler.hpp>
#include <mcp_proxy/proxy/app_registry.hpp>
#include <mcp_proxy/proxy/correlator.hpp>

#include <atomic>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace mcp_proxy {

// ---------------------------------------------------------------------------
// ProxyServer — the running proxy.
//
// Threads:
//   - the caller of Run(): reads the agent channel
//   - one accept thread: admits application connections, housekeeping
//   - one reader per application connection
//   - one short-lived task per tools/call: forwards it, awaits the answer
//     and writes the reply, so the agent reader never blocks on an app
//   - the correlator's timeout sweeper
//
// Threads share state only through AppRegistry, Correlator and the session
// table; the session table lock is never held across socket I/O.
// ---------------------------------------------------------------------------
class ProxyServer {
public:
    ProxyServer(ProxyConfig config, std::unique_ptr<IByteStream> agent_stream);
    ~ProxyServer();

    ProxyServer(const ProxyServer&) = delete;
    ProxyServer& operator=(const ProxyServer&) = delete;

    // Bind the application listener and start background threads.
    [[nodiscard]] Result<void, Error> Start();

    // Start (if needed), then serve the agent channel until it closes or a
    // stop is requested. Always ends with Stop().
    [[nodiscard]] Result<void, Error> Run();

    // Async-signal-safe: only sets a flag the accept thread polls. The accept
    // thread then ends agent reading; in-flight calls are still answered.
    void RequestStop() noexcept;

    // Ordered shutdown, bounded by shutdown_timeout. Idempotent.
    void Stop();

    // Listener port; useful when bound to port 0. 0 before Start().
    [[nodiscard]] uint16_t BoundPort() const;

    [[nodiscard]] const AppRegistry& Registry() const noexcept { return registry_; }
    [[nodiscard]] const Correlator& Calls() const noexcept { return correlator_; }
    [[nodiscard]] size_t OpenConnections() const;

private:
    struct AppSession {
        AppSession(ConnectionId id_in, std::shared_ptr<Connection> connection_in)
            : id(std::move(id_in)), connection(std::move(connection_in)) {}

        const ConnectionId id;
        std::shared_ptr<Connection> connection;
        std::thread reader;
        std::atomic<bool> finished{false};
    };

    void AcceptLoop();
    void AdmitApp(std::unique_ptr<FdStream> stream);
    void ServeApp(const std::shared_ptr<AppSession>& session);
    void HandleAppMessage(const AppSession& session, const nlohmann::json& message,
                          bool& registered);
    [[nodiscard]] Result<void, Error> SendToApp(const ConnectionId& id,
                                                const nlohmann::json& message);

    void HandleAgentMessage(const nlohmann::json& message);
    void DispatchReply(PendingReply pending);
    void SendToAgent(const nlohmann::json& reply);

    void Housekeeping();
    void ReapFinishedSessions();
    [[nodiscard]] bool IsExpectedApp(const std::string& name) const;

    const ProxyConfig config_;
    AppRegistry registry_;
    Correlator correlator_;
    std::shared_ptr<Connection> agent_;
    AgentHandler handler_;

    std::unique_ptr<TcpListener> listener_;
    std::thread accept_thread_;
    std::atomic<bool> started_{false};
    std::atomic<bool> stop_requested_{false};
    std::atomic<bool> stopped_{false};

    mutable std::mutex sessions_mutex_;
    std::map<ConnectionId, std::shared_ptr<AppSession>> sessions_;

    std::mutex calls_mutex_;
    std::vector<std::future<void>> call_tasks_;
};

} // namespace mcp_proxy
