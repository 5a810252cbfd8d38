#pragma once

#include <mcp_proxy/core/result.hpp>
#include <mcp_proxy/core/types.hpp>

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcp_proxy {

// ---------------------------------------------------------------------------
// Application-facing wire protocol (newline-delimited JSON over TCP):
//
//   app -> proxy  {"type":"register","appName":..,"tools":[..]}
//   app -> proxy  {"type":"toolResponse","correlationId":N,"result":{..}}
//   proxy -> app  {"type":"toolInvocation","correlationId":N,"tool":..,
//                  "parameters":{..}|null}
// ---------------------------------------------------------------------------

namespace message_type {
constexpr const char* kRegister = "register";
constexpr const char* kToolResponse = "toolResponse";
constexpr const char* kToolInvocation = "toolInvocation";
} // namespace message_type

// ---------------------------------------------------------------------------
// ToolDefinition — one entry of an application's catalog. The input schema is
// forwarded verbatim and never validated.
// ---------------------------------------------------------------------------
struct ToolDefinition {
    std::string name;
    std::string description;
    nlohmann::json input_schema = nlohmann::json{{"type", "object"}};

    bool operator==(const ToolDefinition& other) const {
        return name == other.name && description == other.description &&
               input_schema == other.input_schema;
    }
};

// ---------------------------------------------------------------------------
// ToolResult — {success:true, data} or {success:false, error}.
// ---------------------------------------------------------------------------
struct ToolResult {
    bool success = false;
    nlohmann::json data;   // null when absent
    std::string error;     // empty on success

    static ToolResult Ok(nlohmann::json data = nullptr) {
        return ToolResult{true, std::move(data), {}};
    }
    static ToolResult Fail(std::string error) {
        return ToolResult{false, nullptr, std::move(error)};
    }

    bool operator==(const ToolResult& other) const {
        return success == other.success && data == other.data &&
               error == other.error;
    }
};

struct RegisterMessage {
    std::string app_name;
    std::vector<ToolDefinition> tools;
};

struct ToolResponseMessage {
    CorrelationId correlation_id = 0;
    ToolResult result;
};

struct ToolInvocationMessage {
    CorrelationId correlation_id = 0;
    std::string tool;
    nlohmann::json parameters;  // object or null
};

// Inbound message on an application connection.
using AppMessage = std::variant<RegisterMessage, ToolResponseMessage>;

// -- Encoding ---------------------------------------------------------------

[[nodiscard]] nlohmann::json ToJson(const ToolDefinition& tool);
[[nodiscard]] nlohmann::json ToJson(const ToolResult& result);
[[nodiscard]] nlohmann::json ToJson(const RegisterMessage& message);
[[nodiscard]] nlohmann::json ToJson(const ToolResponseMessage& message);
[[nodiscard]] nlohmann::json ToJson(const ToolInvocationMessage& message);

// -- Decoding ---------------------------------------------------------------
// All parsers return a Protocol error naming the offending field.

[[nodiscard]] Result<ToolDefinition, Error> ParseToolDefinition(
    const nlohmann::json& value);
[[nodiscard]] Result<ToolResult, Error> ParseToolResult(const nlohmann::json& value);
[[nodiscard]] Result<RegisterMessage, Error> ParseRegisterMessage(
    const nlohmann::json& value);
[[nodiscard]] Result<ToolResponseMessage, Error> ParseToolResponseMessage(
    const nlohmann::json& value);
[[nodiscard]] Result<ToolInvocationMessage, Error> ParseToolInvocationMessage(
    const nlohmann::json& value);

// Dispatch on "type" for messages an application may send to the proxy.
[[nodiscard]] Result<AppMessage, Error> ParseAppMessage(const nlohmann::json& value);

// The "type" field, or empty when missing or not a string.
[[nodiscard]] std::string MessageType(const nlohmann::json& value);

} // namespace mcp_proxy
