#include <mcp_proxy/proxy/agent_handler.hpp>

#include <mcp_proxy/core/log.hpp>
#include <mcp_proxy/core/version.hpp>
#include <mcp_proxy/wire/messages.hpp>

#include <algorithm>

namespace mcp_proxy {

namespace {

constexpr const char* kComponent = "agent";
constexpr const char* kProtocolVersion = "2024-11-05";
constexpr auto kWaitGrace = std::chrono::milliseconds(500);

bool IsValidId(const nlohmann::json& id) {
    return id.is_string() || id.is_number() || id.is_null();
}

nlohmann::json TextContent(const nlohmann::json& data) {
    std::string text;
    if (data.is_string()) {
        text = data.get<std::string>();
    } else if (!data.is_null()) {
        text = data.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }
    return nlohmann::json::array({{{"type", "text"}, {"text", text}}});
}

} // anonymous namespace

AgentHandler::AgentHandler(AppRegistry& registry, Correlator& correlator,
                           InvocationSender sender)
    : registry_(registry), correlator_(correlator), sender_(std::move(sender)) {}

AgentOutcome AgentHandler::HandleMessage(const nlohmann::json& message) {
    if (!message.is_object()) {
        return MakeError(nullptr, rpc_error::kInvalidRequest, "Request must be a JSON object");
    }

    const bool is_notification = !message.contains("id");
    nlohmann::json id = is_notification ? nlohmann::json() : message["id"];

    // Check for JSON-RPC 2.0.
    if (!message.contains("jsonrpc") || message["jsonrpc"] != "2.0") {
        if (is_notification) {
            LogWarn(kComponent, "Dropping notification without jsonrpc 2.0 envelope");
            return std::monostate{};
        }
        return MakeError(IsValidId(id) ? id : nlohmann::json(),
                         rpc_error::kInvalidRequest, "Invalid JSON-RPC version");
    }
    if (!IsValidId(id)) {
        return MakeError(nullptr, rpc_error::kInvalidRequest, "Invalid request id");
    }
    if (!message.contains("method") || !message["method"].is_string()) {
        if (is_notification) {
            return std::monostate{};
        }
        return MakeError(id, rpc_error::kInvalidRequest, "Missing 'method'");
    }

    const auto method = message["method"].get<std::string>();
    if (is_notification) {
        LogDebug(kComponent, "Notification: " + method);
        return std::monostate{};
    }

    const auto params = message.contains("params") ? message["params"]
                                                   : nlohmann::json::object();

    if (method == "initialize") {
        return HandleInitialize(id);
    } else if (method == "ping") {
        return MakeResult(id, nlohmann::json::object());
    } else if (method == "tools/list") {
        return HandleToolsList(id);
    } else if (method == "tools/call") {
        return HandleToolsCall(params, id);
    }
    return MakeError(id, rpc_error::kMethodNotFound, "Method not found: " + method);
}

nlohmann::json AgentHandler::HandleInitialize(const nlohmann::json& id) {
    nlohmann::json result;
    result["protocolVersion"] = kProtocolVersion;
    result["capabilities"] = {
        {"tools", {{"listChanged", false}}}
    };
    result["serverInfo"] = {
        {"name", "mcp-proxy"},
        {"version", kVersion}
    };
    return MakeResult(id, result);
}

nlohmann::json AgentHandler::HandleToolsList(const nlohmann::json& id) {
    nlohmann::json tools = nlohmann::json::array();
    for (const auto& entry : registry_.AllTools()) {
        tools.push_back({
            {"name", entry.exposed_name},
            {"description", entry.tool.description},
            {"inputSchema", entry.tool.input_schema}
        });
    }
    return MakeResult(id, {{"tools", tools}});
}

AgentOutcome AgentHandler::HandleToolsCall(const nlohmann::json& params,
                                           const nlohmann::json& id) {
    if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
        return MakeError(id, rpc_error::kInvalidParams, "Missing 'name' parameter");
    }
    auto tool_name = params["name"].get<std::string>();

    nlohmann::json arguments = nullptr;
    if (params.contains("arguments")) {
        arguments = params["arguments"];
        if (!arguments.is_object() && !arguments.is_null()) {
            return MakeError(id, rpc_error::kInvalidParams,
                             "'arguments' must be an object");
        }
    }

    auto owner = registry_.FindOwner(tool_name);
    if (owner.IsErr()) {
        const auto& route = owner.Error();
        if (route.reason == RouteError::Reason::Ambiguous) {
            return MakeError(id, rpc_error::kToolAmbiguous, route.message,
                             {{"candidates", route.candidates}});
        }
        return MakeError(id, rpc_error::kToolNotFound, route.message);
    }

    // Forward the name the application declared, not the exposed one.
    std::string app_tool = tool_name;
    if (auto record = registry_.Get(owner.Value())) {
        for (const auto& tool : record->tools) {
            if (tool_name == tool.name || tool_name == BareToolName(*record, tool) ||
                tool_name == QualifiedToolName(*record, tool)) {
                app_tool = tool.name;
                break;
            }
        }
    }

    return PendingReply{id, tool_name, owner.Value(), app_tool, std::move(arguments)};
}

nlohmann::json AgentHandler::Forward(const PendingReply& pending) {
    auto handle = correlator_.BeginCall(pending.owner, pending.app_tool);
    if (!handle.call->IsResolved()) {
        ToolInvocationMessage invocation{handle.id, pending.app_tool, pending.arguments};
        auto sent = sender_(pending.owner, ToJson(invocation));
        if (sent.IsErr()) {
            LogWarn(kComponent, "Forwarding '" + pending.app_tool +
                                    "' failed: " + sent.Error().ToString());
            correlator_.Fail(handle.id, CallOutcome::Disconnected, "application disconnected");
        }
    }
    return AwaitReply(pending, handle);
}

nlohmann::json AgentHandler::AwaitReply(const PendingReply& pending,
                                        const CallHandle& handle) {
    const auto deadline = handle.call->CreatedAt() + correlator_.Timeout() + kWaitGrace;
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - Clock::now());
    auto resolution = handle.call->Wait(std::max(left, std::chrono::milliseconds(0)));
    if (!resolution) {
        correlator_.Expire(handle.id);
        resolution = handle.call->Wait(std::chrono::milliseconds(0));
    }
    if (!resolution) {
        // Expire lost to a concurrent resolver that has not published yet.
        resolution = handle.call->Wait(kWaitGrace);
    }
    if (!resolution) {
        return MakeError(pending.request_id, rpc_error::kTimeout, "timeout");
    }
    return ReplyFor(pending.request_id, pending.tool, *resolution);
}

nlohmann::json AgentHandler::ReplyFor(const nlohmann::json& id, const std::string& tool,
                                      const CallResolution& resolution) {
    const auto& result = resolution.result;
    nlohmann::json data = {{"tool", tool}, {"outcome", CallOutcomeName(resolution.outcome)}};

    switch (resolution.outcome) {
        case CallOutcome::Completed:
            break;
        case CallOutcome::Timeout:
            return MakeError(id, rpc_error::kTimeout, result.error, data);
        case CallOutcome::Disconnected:
            return MakeError(id, rpc_error::kDisconnected, result.error, data);
        case CallOutcome::Cancelled:
            return MakeError(id, rpc_error::kCancelled, result.error, data);
    }

    if (!result.success) {
        return MakeError(id, rpc_error::kToolFailed, result.error, data);
    }

    nlohmann::json response_result;
    response_result["content"] = TextContent(result.data);
    if (result.data.is_object()) {
        response_result["structuredContent"] = result.data;
    }
    return MakeResult(id, response_result);
}

nlohmann::json AgentHandler::ParseErrorReply(const std::string& detail) {
    return MakeError(nullptr, rpc_error::kParseError, "Parse error",
                     detail.empty() ? nlohmann::json() : nlohmann::json(detail));
}

nlohmann::json AgentHandler::MakeError(const nlohmann::json& id, int code,
                                       const std::string& message,
                                       const nlohmann::json& data) {
    nlohmann::json error = {
        {"code", code},
        {"message", message}
    };
    if (!data.is_null()) {
        error["data"] = data;
    }
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", error}
    };
}

nlohmann::json AgentHandler::MakeResult(const nlohmann::json& id,
                                        const nlohmann::json& result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result}
    };
}

} // namespace mcp_proxy
