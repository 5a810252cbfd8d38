#pragma once

#include <mcp_proxy/core/result.hpp>
#include <mcp_proxy/core/types.hpp>
#include <mcp_proxy/proxy/app_registry.hpp>
#include <mcp_proxy/proxy/correlator.hpp>

#include <chrono>
#include <functional>
#include <string>
#include <variant>

#include <nlohmann/json.hpp>

namespace mcp_proxy {

// JSON-RPC error codes used on the agent channel.
namespace rpc_error {
constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kToolFailed = -32000;
constexpr int kToolNotFound = -32001;
constexpr int kToolAmbiguous = -32002;
constexpr int kTimeout = -32003;
constexpr int kDisconnected = -32004;
constexpr int kCancelled = -32005;
} // namespace rpc_error

// A routed tools/call that still has to be forwarded and answered.
struct PendingReply {
    nlohmann::json request_id;
    std::string tool;       // as the agent named it
    ConnectionId owner;
    std::string app_tool;   // as the application declared it
    nlohmann::json arguments;
};

// monostate: nothing to send (notification).
// json: an immediate reply.
// PendingReply: finish with Forward(), off the stdio reader thread.
using AgentOutcome = std::variant<std::monostate, nlohmann::json, PendingReply>;

// Sends one encoded toolInvocation to the owning application connection.
using InvocationSender =
    std::function<Result<void, Error>(const ConnectionId&, const nlohmann::json&)>;

// ---------------------------------------------------------------------------
// AgentHandler — JSON-RPC 2.0 over the agent's stdio channel.
//
// Methods:
//   - initialize
//   - ping
//   - tools/list
//   - tools/call   (routed, forwarded, correlated)
//   - notifications/* (no response)
//
// Every request with an id gets exactly one reply. Replies to concurrent
// tools/call requests may be produced out of order; the id is echoed.
// ---------------------------------------------------------------------------
class AgentHandler {
public:
    AgentHandler(AppRegistry& registry, Correlator& correlator, InvocationSender sender);

    [[nodiscard]] AgentOutcome HandleMessage(const nlohmann::json& message);

    // Sends the invocation to its owner and blocks until the call resolves,
    // never longer than the correlator timeout plus a short grace period from
    // the moment the call began.
    [[nodiscard]] nlohmann::json Forward(const PendingReply& pending);

    // The reply for a line that is not valid JSON.
    [[nodiscard]] static nlohmann::json ParseErrorReply(const std::string& detail);

    [[nodiscard]] static nlohmann::json MakeError(const nlohmann::json& id, int code,
                                                  const std::string& message,
                                                  const nlohmann::json& data = nullptr);
    [[nodiscard]] static nlohmann::json MakeResult(const nlohmann::json& id,
                                                   const nlohmann::json& result);

    // Maps a resolved call to a JSON-RPC reply.
    [[nodiscard]] static nlohmann::json ReplyFor(const nlohmann::json& id,
                                                 const std::string& tool,
                                                 const CallResolution& resolution);

private:
    nlohmann::json HandleInitialize(const nlohmann::json& id);
    nlohmann::json HandleToolsList(const nlohmann::json& id);
    AgentOutcome HandleToolsCall(const nlohmann::json& params, const nlohmann::json& id);
    nlohmann::json AwaitReply(const PendingReply& pending, const CallHandle& handle);

    AppRegistry& registry_;
    Correlator& correlator_;
    InvocationSender sender_;
};

} // namespace mcp_proxy
