#include <mcp_proxy/config/config_loader.hpp>

#include <mcp_proxy/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <fstream>

namespace mcp_proxy {

namespace {

constexpr const char* kDefaultConfigFile = ".mcpproxy.yaml";
constexpr const char* kConfigEnvVar = "MCP_PROXY_CONFIG";

template <typename T>
Result<T, Error> ConfigErr(const std::string& message) {
    return Result<T, Error>::Err(Error::Config(message));
}

Result<ExpectedApp, Error> ParseYamlApp(const YAML::Node& node) {
    if (!node["name"]) {
        return ConfigErr<ExpectedApp>("App entry missing 'name' field");
    }
    ExpectedApp app;
    app.name = node["name"].as<std::string>();
    if (node["endpoint"]) {
        app.endpoint = node["endpoint"].as<std::string>();
    }
    if (node["description"]) {
        app.description = node["description"].as<std::string>();
    }
    return Result<ExpectedApp, Error>::Ok(std::move(app));
}

Result<void, Error> ApplyProxyNode(const YAML::Node& proxy, ProxyConfig& config) {
    if (proxy["bind_address"]) {
        auto bind = ParseBindAddress(proxy["bind_address"].as<std::string>());
        if (bind.IsErr()) {
            return Result<void, Error>::Err(std::move(bind).Error());
        }
        config.bind = std::move(bind).Value();
    }
    if (proxy["max_connections"]) {
        config.max_connections = proxy["max_connections"].as<int>();
    }
    if (proxy["call_timeout_seconds"]) {
        config.call_timeout = std::chrono::seconds(proxy["call_timeout_seconds"].as<int>());
    }
    if (proxy["retention_seconds"]) {
        config.retention = std::chrono::seconds(proxy["retention_seconds"].as<int>());
    }
    if (proxy["sweep_interval_ms"]) {
        config.sweep_interval = std::chrono::milliseconds(proxy["sweep_interval_ms"].as<int>());
    }
    if (proxy["shutdown_timeout_seconds"]) {
        config.shutdown_timeout =
            std::chrono::seconds(proxy["shutdown_timeout_seconds"].as<int>());
    }
    if (proxy["tool_naming"]) {
        auto naming = ParseToolNaming(proxy["tool_naming"].as<std::string>());
        if (naming.IsErr()) {
            return Result<void, Error>::Err(Error::Config(naming.Error()));
        }
        config.tool_naming = naming.Value();
    }
    if (proxy["log_level"]) {
        auto text = proxy["log_level"].as<std::string>();
        auto level = ParseLogLevel(text);
        if (!level) {
            return Result<void, Error>::Err(Error::Config("Unknown log_level: " + text));
        }
        config.log_level = *level;
    }
    if (proxy["log_file"]) {
        config.log_file = proxy["log_file"].as<std::string>();
    }
    if (proxy["log_json"]) {
        config.log_json = proxy["log_json"].as<bool>();
    }
    if (proxy["apps"]) {
        for (const auto& app_node : proxy["apps"]) {
            auto app = ParseYamlApp(app_node);
            if (app.IsErr()) {
                return Result<void, Error>::Err(std::move(app).Error());
            }
            config.apps.push_back(std::move(app).Value());
        }
    }
    return Result<void, Error>::Ok();
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// ParseBindAddress
// ---------------------------------------------------------------------------
Result<BindAddress, Error> ParseBindAddress(std::string_view text) {
    auto colon = text.rfind(':');
    if (colon == std::string_view::npos) {
        return ConfigErr<BindAddress>("Bind address must be host:port, got '" +
                                      std::string(text) + "'");
    }
    auto host = std::string(text.substr(0, colon));
    auto port_text = std::string(text.substr(colon + 1));
    if (port_text.empty() || port_text.find_first_not_of("0123456789") != std::string::npos ||
        port_text.size() > 5) {
        return ConfigErr<BindAddress>("Invalid port in bind address: '" +
                                      std::string(text) + "'");
    }
    auto port = std::stoi(port_text);
    if (port > 65535) {
        return ConfigErr<BindAddress>("Port out of range: " + port_text);
    }
    // Allow bracketed IPv6 literals such as [::1]:5100.
    if (host.size() >= 2 && host.front() == '[' && host.back() == ']') {
        host = host.substr(1, host.size() - 2);
    }
    BindAddress bind;
    bind.host = host.empty() ? "localhost" : host;
    bind.port = static_cast<uint16_t>(port);
    return Result<BindAddress, Error>::Ok(std::move(bind));
}

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<ProxyConfig, Error> LoadFromYaml(std::string_view file_path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(std::string(file_path));
    } catch (const YAML::Exception& e) {
        return ConfigErr<ProxyConfig>("Failed to parse YAML file: " + std::string(e.what()));
    }

    ProxyConfig config;
    if (!root["proxy"]) {
        return Result<ProxyConfig, Error>::Ok(std::move(config));
    }

    try {
        auto applied = ApplyProxyNode(root["proxy"], config);
        if (applied.IsErr()) {
            return Result<ProxyConfig, Error>::Err(std::move(applied).Error());
        }
    } catch (const YAML::Exception& e) {
        return ConfigErr<ProxyConfig>("Invalid value in " + std::string(file_path) + ": " +
                                      e.what());
    }
    return Result<ProxyConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<CliOverrides, Error> LoadFromCli(int argc, const char* const* argv) {
    argparse::ArgumentParser program("mcp-proxy", kVersion,
                                     argparse::default_arguments::help);
    program.add_description(
        "Federates tool catalogs of connected applications behind one MCP stdio endpoint.");

    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--bind")
        .help("Listen address for applications (host:port)");
    program.add_argument("--max-connections")
        .help("Maximum concurrent application connections")
        .scan<'i', int>();
    program.add_argument("--timeout")
        .help("Per-call timeout in seconds")
        .scan<'i', int>();
    program.add_argument("--naming")
        .help("Catalog naming: on_conflict or qualified");
    program.add_argument("--log-level")
        .help("debug, info, warn or error");
    program.add_argument("--log-file")
        .help("Write logs to this file instead of stderr");
    program.add_argument("--log-json")
        .help("JSON log lines")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-v", "--verbose")
        .help("Debug logging")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--no-color")
        .help("Disable colored log output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--version")
        .help("Print version and exit")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        return ConfigErr<CliOverrides>("CLI parse error: " + std::string(e.what()));
    }

    CliOverrides cli;
    cli.config_path = program.present("--config");

    if (auto val = program.present("--bind")) {
        auto bind = ParseBindAddress(*val);
        if (bind.IsErr()) {
            return Result<CliOverrides, Error>::Err(std::move(bind).Error());
        }
        cli.bind = std::move(bind).Value();
    }
    cli.max_connections = program.present<int>("--max-connections");
    cli.timeout_seconds = program.present<int>("--timeout");

    if (auto val = program.present("--naming")) {
        auto naming = ParseToolNaming(*val);
        if (naming.IsErr()) {
            return ConfigErr<CliOverrides>("Invalid --naming: " + naming.Error());
        }
        cli.tool_naming = naming.Value();
    }
    if (auto val = program.present("--log-level")) {
        auto level = ParseLogLevel(*val);
        if (!level) {
            return ConfigErr<CliOverrides>("Invalid --log-level: " + *val);
        }
        cli.log_level = *level;
    }
    if (program.get<bool>("--verbose")) {
        cli.log_level = LogLevel::Debug;
    }
    cli.log_file = program.present("--log-file");
    cli.log_json = program.get<bool>("--log-json");
    cli.no_color = program.get<bool>("--no-color");
    cli.show_version = program.get<bool>("--version");

    return Result<CliOverrides, Error>::Ok(std::move(cli));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
ProxyConfig MergeConfigs(const ProxyConfig& base, const CliOverrides& cli) {
    ProxyConfig merged = base;
    if (cli.bind) {
        merged.bind = *cli.bind;
    }
    if (cli.max_connections) {
        merged.max_connections = *cli.max_connections;
    }
    if (cli.timeout_seconds) {
        merged.call_timeout = std::chrono::seconds(*cli.timeout_seconds);
    }
    if (cli.tool_naming) {
        merged.tool_naming = *cli.tool_naming;
    }
    if (cli.log_level) {
        merged.log_level = *cli.log_level;
    }
    if (cli.log_file) {
        merged.log_file = cli.log_file;
    }
    if (cli.log_json) {
        merged.log_json = true;
    }
    return merged;
}

// ---------------------------------------------------------------------------
// ResolveConfigPath
// ---------------------------------------------------------------------------
std::optional<std::string> ResolveConfigPath(const CliOverrides& cli) {
    if (cli.config_path) {
        return cli.config_path;
    }
    const char* env_val = std::getenv(kConfigEnvVar);
    if (env_val != nullptr && *env_val != '\0') {
        return std::string(env_val);
    }
    if (std::ifstream(kDefaultConfigFile).good()) {
        return std::string(kDefaultConfigFile);
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const ProxyConfig& config) {
    if (config.max_connections <= 0) {
        return ConfigErr<void>("max_connections must be positive, got " +
                               std::to_string(config.max_connections));
    }
    if (config.call_timeout.count() <= 0) {
        return ConfigErr<void>("Call timeout must be positive");
    }
    if (config.sweep_interval.count() <= 0) {
        return ConfigErr<void>("sweep_interval_ms must be positive");
    }
    if (config.retention.count() < 0) {
        return ConfigErr<void>("retention_seconds must not be negative");
    }
    if (config.shutdown_timeout.count() <= 0) {
        return ConfigErr<void>("shutdown_timeout_seconds must be positive");
    }
    for (const auto& app : config.apps) {
        if (app.name.empty()) {
            return ConfigErr<void>("Expected app entry has an empty name");
        }
    }
    return Result<void, Error>::Ok();
}

} // namespace mcp_proxy
