#pragma once

#include <mcp_proxy/config/proxy_config.hpp>
#include <mcp_proxy/core/result.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace mcp_proxy {

// Fields set on the command line. Unset fields leave the file/default value.
struct CliOverrides {
    std::optional<std::string> config_path;
    std::optional<BindAddress> bind;
    std::optional<int> max_connections;
    std::optional<int> timeout_seconds;
    std::optional<ToolNaming> tool_naming;
    std::optional<LogLevel> log_level;
    std::optional<std::string> log_file;
    bool log_json = false;
    bool no_color = false;
    bool show_version = false;
};

// Parse "host:port". A bare ":port" means localhost.
Result<BindAddress, Error> ParseBindAddress(std::string_view text);

// Parse a YAML config file into a ProxyConfig (defaults for absent keys).
Result<ProxyConfig, Error> LoadFromYaml(std::string_view file_path);

// Parse CLI arguments.
Result<CliOverrides, Error> LoadFromCli(int argc, const char* const* argv);

// Apply CLI overrides on top of a base config.
ProxyConfig MergeConfigs(const ProxyConfig& base, const CliOverrides& cli);

// Config path precedence: --config, $MCP_PROXY_CONFIG, ./.mcpproxy.yaml if it
// exists. nullopt means "use defaults".
std::optional<std::string> ResolveConfigPath(const CliOverrides& cli);

// Validate that values are sane.
Result<void, Error> ValidateConfig(const ProxyConfig& config);

} // namespace mcp_proxy
