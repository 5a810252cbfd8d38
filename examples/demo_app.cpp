// Minimal application that exposes two tools through a running mcp-proxy.
//
//   mcp-proxy-demo-app --proxy localhost:5100 --name DemoApp

#include <mcp_proxy/client/app_client.hpp>
#include <mcp_proxy/config/config_loader.hpp>
#include <mcp_proxy/core/log.hpp>
#include <mcp_proxy/core/terminal.hpp>
#include <mcp_proxy/core/version.hpp>

#include <argparse/argparse.hpp>

#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>

using namespace mcp_proxy;

namespace {

LocalToolRegistry DemoTools() {
    LocalToolRegistry tools;
    tools.Register("Ping", "Replies with pong.", {{"type", "object"}},
                   [](const nlohmann::json&) { return ToolResult::Ok("pong"); });
    tools.Register(
        "Echo", "Returns the message it was given.",
        {{"type", "object"},
         {"properties", {{"message", {{"type", "string"}}}}},
         {"required", {"message"}}},
        [](const nlohmann::json& params) {
            if (!params.contains("message") || !params["message"].is_string()) {
                return ToolResult::Fail("Missing 'message' parameter");
            }
            return ToolResult::Ok(params["message"]);
        });
    return tools;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    argparse::ArgumentParser program("mcp-proxy-demo-app", kVersion);
    program.add_argument("--proxy")
        .help("Proxy application listener (host:port)")
        .default_value(std::string("localhost:5100"));
    program.add_argument("--name")
        .help("Application name to register")
        .default_value(std::string("DemoApp"));
    program.add_argument("--retries")
        .help("Connection attempts before giving up")
        .default_value(10)
        .scan<'i', int>();

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n" << program;
        return 2;
    }

    InitGlobalLogger(std::make_unique<ColorConsoleSink>(ConsoleColorEnabled(false)),
                     LogLevel::Info);
    std::signal(SIGPIPE, SIG_IGN);

    auto proxy = ParseBindAddress(program.get<std::string>("--proxy"));
    if (proxy.IsErr()) {
        std::cerr << "Error: " << proxy.Error().ToString() << "\n";
        return proxy.Error().ExitCode();
    }

    AppClient client(program.get<std::string>("--name"), DemoTools());
    auto connected = client.ConnectWithRetry(proxy.Value().host, proxy.Value().port,
                                             program.get<int>("--retries"),
                                             std::chrono::seconds(1));
    if (connected.IsErr()) {
        LogError("demo", connected.Error().ToString());
        return connected.Error().ExitCode();
    }

    auto registered = client.Register();
    if (registered.IsErr()) {
        LogError("demo", registered.Error().ToString());
        return registered.Error().ExitCode();
    }

    auto served = client.Serve();
    if (served.IsErr()) {
        LogError("demo", served.Error().ToString());
        return served.Error().ExitCode();
    }
    return 0;
}
