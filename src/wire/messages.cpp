#include <mcp_proxy/wire/messages.hpp>

#include <cmath>
#include <cstdint>
#include <limits>

namespace mcp_proxy {

namespace {

template <typename T>
Result<T, Error> Fail(const char* operation, const std::string& message) {
    return Result<T, Error>::Err(Error::Protocol(operation, message));
}

bool IsStringField(const nlohmann::json& value, const char* key) {
    return value.contains(key) && value[key].is_string();
}

// Correlation ids travel as JSON numbers; accept integral doubles too since
// some serializers emit 7.0 for 7. Anything outside the id range is rejected.
std::optional<CorrelationId> ReadCorrelationId(const nlohmann::json& value) {
    if (!value.contains("correlationId")) return std::nullopt;
    const auto& id = value["correlationId"];
    if (id.is_number_unsigned()) {
        auto u = id.get<uint64_t>();
        if (u > static_cast<uint64_t>(std::numeric_limits<CorrelationId>::max())) {
            return std::nullopt;
        }
        return static_cast<CorrelationId>(u);
    }
    if (id.is_number_integer()) {
        return id.get<CorrelationId>();
    }
    if (id.is_number_float()) {
        auto d = id.get<double>();
        // 2^63 is exactly representable; max() is not.
        constexpr double kUpper = 9223372036854775808.0;
        constexpr double kLower = -kUpper;
        if (!std::isfinite(d) || d < kLower || d >= kUpper) {
            return std::nullopt;
        }
        auto n = static_cast<CorrelationId>(d);
        if (static_cast<double>(n) == d) return n;
    }
    return std::nullopt;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Encoding
// ---------------------------------------------------------------------------
nlohmann::json ToJson(const ToolDefinition& tool) {
    return {
        {"name", tool.name},
        {"description", tool.description},
        {"inputSchema", tool.input_schema},
    };
}

nlohmann::json ToJson(const ToolResult& result) {
    return {
        {"success", result.success},
        {"data", result.data},
        {"error", result.success ? nlohmann::json(nullptr)
                                 : nlohmann::json(result.error)},
    };
}

nlohmann::json ToJson(const RegisterMessage& message) {
    nlohmann::json tools = nlohmann::json::array();
    for (const auto& tool : message.tools) {
        tools.push_back(ToJson(tool));
    }
    return {
        {"type", message_type::kRegister},
        {"appName", message.app_name},
        {"tools", tools},
    };
}

nlohmann::json ToJson(const ToolResponseMessage& message) {
    return {
        {"type", message_type::kToolResponse},
        {"correlationId", message.correlation_id},
        {"result", ToJson(message.result)},
    };
}

nlohmann::json ToJson(const ToolInvocationMessage& message) {
    return {
        {"type", message_type::kToolInvocation},
        {"correlationId", message.correlation_id},
        {"tool", message.tool},
        {"parameters", message.parameters},
    };
}

// ---------------------------------------------------------------------------
// Decoding
// ---------------------------------------------------------------------------
std::string MessageType(const nlohmann::json& value) {
    if (value.is_object() && IsStringField(value, "type")) {
        return value["type"].get<std::string>();
    }
    return "";
}

Result<ToolDefinition, Error> ParseToolDefinition(const nlohmann::json& value) {
    if (!value.is_object()) {
        return Fail<ToolDefinition>("ParseToolDefinition", "Tool entry is not an object");
    }
    if (!IsStringField(value, "name") || value["name"].get<std::string>().empty()) {
        return Fail<ToolDefinition>("ParseToolDefinition",
                                    "Tool entry missing string 'name'");
    }

    ToolDefinition tool;
    tool.name = value["name"].get<std::string>();
    if (value.contains("description")) {
        if (!value["description"].is_string() && !value["description"].is_null()) {
            return Fail<ToolDefinition>("ParseToolDefinition",
                                        "Tool '" + tool.name +
                                            "': 'description' must be a string");
        }
        if (value["description"].is_string()) {
            tool.description = value["description"].get<std::string>();
        }
    }
    if (value.contains("inputSchema") && !value["inputSchema"].is_null()) {
        tool.input_schema = value["inputSchema"];
    }
    return Result<ToolDefinition, Error>::Ok(std::move(tool));
}

Result<ToolResult, Error> ParseToolResult(const nlohmann::json& value) {
    if (!value.is_object()) {
        return Fail<ToolResult>("ParseToolResult", "'result' is not an object");
    }
    if (!value.contains("success") || !value["success"].is_boolean()) {
        return Fail<ToolResult>("ParseToolResult", "'result.success' missing or not a boolean");
    }

    ToolResult result;
    result.success = value["success"].get<bool>();
    if (result.success) {
        result.data = value.value("data", nlohmann::json(nullptr));
        return Result<ToolResult, Error>::Ok(std::move(result));
    }

    if (IsStringField(value, "error") && !value["error"].get<std::string>().empty()) {
        result.error = value["error"].get<std::string>();
    } else {
        result.error = "unknown error";
    }
    return Result<ToolResult, Error>::Ok(std::move(result));
}

Result<RegisterMessage, Error> ParseRegisterMessage(const nlohmann::json& value) {
    if (!IsStringField(value, "appName")) {
        return Fail<RegisterMessage>("ParseRegisterMessage",
                                     "Registration missing string 'appName'");
    }

    RegisterMessage message;
    message.app_name = value["appName"].get<std::string>();

    if (value.contains("tools") && !value["tools"].is_null()) {
        if (!value["tools"].is_array()) {
            return Fail<RegisterMessage>("ParseRegisterMessage",
                                         "'tools' must be an array");
        }
        for (const auto& entry : value["tools"]) {
            auto tool = ParseToolDefinition(entry);
            if (tool.IsErr()) {
                return Result<RegisterMessage, Error>::Err(std::move(tool).Error());
            }
            message.tools.push_back(std::move(tool).Value());
        }
    }
    return Result<RegisterMessage, Error>::Ok(std::move(message));
}

Result<ToolResponseMessage, Error> ParseToolResponseMessage(const nlohmann::json& value) {
    auto id = ReadCorrelationId(value);
    if (!id) {
        return Fail<ToolResponseMessage>("ParseToolResponseMessage",
                                         "Tool response missing numeric 'correlationId'");
    }
    if (!value.contains("result")) {
        return Fail<ToolResponseMessage>("ParseToolResponseMessage",
                                         "Tool response missing 'result'");
    }
    auto result = ParseToolResult(value["result"]);
    if (result.IsErr()) {
        return Result<ToolResponseMessage, Error>::Err(std::move(result).Error());
    }
    return Result<ToolResponseMessage, Error>::Ok(
        ToolResponseMessage{*id, std::move(result).Value()});
}

Result<ToolInvocationMessage, Error> ParseToolInvocationMessage(
    const nlohmann::json& value) {
    if (MessageType(value) != message_type::kToolInvocation) {
        return Fail<ToolInvocationMessage>("ParseToolInvocationMessage",
                                           "Not a toolInvocation message");
    }
    auto id = ReadCorrelationId(value);
    if (!id) {
        return Fail<ToolInvocationMessage>("ParseToolInvocationMessage",
                                           "Invocation missing numeric 'correlationId'");
    }
    if (!IsStringField(value, "tool")) {
        return Fail<ToolInvocationMessage>("ParseToolInvocationMessage",
                                           "Invocation missing string 'tool'");
    }
    ToolInvocationMessage message;
    message.correlation_id = *id;
    message.tool = value["tool"].get<std::string>();
    message.parameters = value.value("parameters", nlohmann::json(nullptr));
    return Result<ToolInvocationMessage, Error>::Ok(std::move(message));
}

Result<AppMessage, Error> ParseAppMessage(const nlohmann::json& value) {
    if (!value.is_object()) {
        return Fail<AppMessage>("ParseAppMessage", "Message is not a JSON object");
    }
    auto type = MessageType(value);
    if (type.empty()) {
        return Fail<AppMessage>("ParseAppMessage", "Message missing string 'type'");
    }
    if (type == message_type::kRegister) {
        auto message = ParseRegisterMessage(value);
        if (message.IsErr()) {
            return Result<AppMessage, Error>::Err(std::move(message).Error());
        }
        return Result<AppMessage, Error>::Ok(AppMessage{std::move(message).Value()});
    }
    if (type == message_type::kToolResponse) {
        auto message = ParseToolResponseMessage(value);
        if (message.IsErr()) {
            return Result<AppMessage, Error>::Err(std::move(message).Error());
        }
        return Result<AppMessage, Error>::Ok(AppMessage{std::move(message).Value()});
    }
    return Fail<AppMessage>("ParseAppMessage", "Unknown message type: " + type);
}

} // namespace mcp_proxy
