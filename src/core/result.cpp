#include <mcp_proxy/core/result.hpp>

#include <nlohmann/json.hpp>

#include <sstream>

namespace mcp_proxy {

Error Error::Transport(std::string operation, std::string endpoint,
                       std::string message) {
    return Error{std::move(operation), std::move(endpoint),
                 std::move(message), ErrorCategory::Transport};
}

Error Error::Protocol(std::string operation, std::string message) {
    return Error{std::move(operation), "", std::move(message),
                 ErrorCategory::Protocol};
}

Error Error::Config(std::string message) {
    return Error{"ConfigLoader", "", std::move(message), ErrorCategory::Config};
}

std::string Error::ToString() const {
    std::ostringstream oss;
    oss << operation;
    if (!endpoint.empty()) {
        oss << " [" << endpoint << "]";
    }
    oss << ": " << message;
    return oss.str();
}

std::string Error::ToJson() const {
    nlohmann::json body = {
        {"category", CategoryName()},
        {"operation", operation},
        {"message", message},
        {"exit_code", ExitCode()},
    };
    if (!endpoint.empty()) {
        body["endpoint"] = endpoint;
    }
    return nlohmann::json{{"error", body}}.dump();
}

} // namespace mcp_proxy
