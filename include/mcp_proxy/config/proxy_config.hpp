#pragma once

#include <mcp_proxy/core/log.hpp>
#include <mcp_proxy/proxy/tool_router.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace mcp_proxy {

// An application the operator expects to connect. Informational only.
struct ExpectedApp {
    std::string name;
    std::string endpoint;
    std::string description;
};

struct BindAddress {
    std::string host = "localhost";
    uint16_t port = 5100;

    [[nodiscard]] std::string ToString() const {
        return host + ":" + std::to_string(port);
    }
};

struct ProxyConfig {
    BindAddress bind;
    int max_connections = 50;
    std::chrono::milliseconds call_timeout{std::chrono::seconds(30)};
    std::chrono::seconds retention{std::chrono::hours(1)};
    std::chrono::milliseconds sweep_interval{250};
    std::chrono::milliseconds shutdown_timeout{std::chrono::seconds(5)};
    ToolNaming tool_naming = ToolNaming::OnConflict;

    LogLevel log_level = LogLevel::Info;
    std::optional<std::string> log_file;
    bool log_json = false;

    std::vector<ExpectedApp> apps;
};

} // namespace mcp_proxy
