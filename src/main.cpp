#include <mcp_proxy/config/config_loader.hpp>
#include <mcp_proxy/core/log.hpp>
#include <mcp_proxy/core/terminal.hpp>
#include <mcp_proxy/core/version.hpp>
#include <mcp_proxy/net/fd_stream.hpp>
#include <mcp_proxy/proxy/proxy_server.hpp>

#include <atomic>
#include <csignal>
#include <signal.h>
#include <iostream>
#include <memory>
#include <string>

namespace {

using namespace mcp_proxy;

constexpr int kExitSuccess = 0;

std::atomic<ProxyServer*> g_server{nullptr};

extern "C" void HandleStopSignal(int /*signum*/) {
    if (auto* server = g_server.load()) {
        server->RequestStop();
    }
}

void InstallSignalHandlers() {
    struct sigaction action {};
    action.sa_handler = HandleStopSignal;
    sigemptyset(&action.sa_mask);
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);

    // Peer resets surface as write errors, not as a process kill.
    std::signal(SIGPIPE, SIG_IGN);
}

int Fail(const Error& error) {
    std::cerr << "Error: " << error.ToString() << "\n";
    return error.ExitCode();
}

// Sink selection: --log-file, else --log-json on stderr, else console.
Result<void, Error> InitLogging(const ProxyConfig& config, bool no_color) {
    std::unique_ptr<ILogSink> sink;
    if (config.log_file) {
        auto file = FileSink::Open(*config.log_file, config.log_json);
        if (file.IsErr()) {
            return Result<void, Error>::Err(std::move(file).Error());
        }
        sink = std::move(file).Value();
    } else if (config.log_json) {
        sink = std::make_unique<JsonSink>(std::cerr);
    } else {
        sink = std::make_unique<ColorConsoleSink>(ConsoleColorEnabled(no_color));
    }
    InitGlobalLogger(std::move(sink), config.log_level);
    return Result<void, Error>::Ok();
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    auto cli_result = LoadFromCli(argc, argv);
    if (cli_result.IsErr()) {
        return Fail(cli_result.Error());
    }
    const auto cli = std::move(cli_result).Value();

    if (cli.show_version) {
        std::cout << "mcp-proxy " << kVersion << "\n";
        return kExitSuccess;
    }

    ProxyConfig base;
    auto config_path = ResolveConfigPath(cli);
    if (config_path) {
        auto loaded = LoadFromYaml(*config_path);
        if (loaded.IsErr()) {
            return Fail(loaded.Error());
        }
        base = std::move(loaded).Value();
    }

    auto config = MergeConfigs(base, cli);
    auto valid = ValidateConfig(config);
    if (valid.IsErr()) {
        return Fail(valid.Error());
    }

    auto logging = InitLogging(config, cli.no_color);
    if (logging.IsErr()) {
        return Fail(logging.Error());
    }
    if (config_path) {
        LogInfo("main", "Loaded config from " + *config_path);
    }

    InstallSignalHandlers();

    ProxyServer server(config, FdStream::Stdio());
    g_server = &server;
    auto run = server.Run();
    g_server = nullptr;

    if (run.IsErr()) {
        LogError("main", run.Error().ToString());
        return Fail(run.Error());
    }
    return kExitSuccess;
}
