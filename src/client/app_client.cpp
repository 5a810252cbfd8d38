#include <mcp_proxy/client/app_client.hpp>

#include <mcp_proxy/core/log.hpp>
#include <mcp_proxy/net/fd_stream.hpp>
#include <mcp_proxy/wire/messages.hpp>

#include <thread>

namespace mcp_proxy {

namespace {

constexpr const char* kComponent = "app-client";

} // anonymous namespace

AppClient::AppClient(std::string app_name, LocalToolRegistry tools)
    : app_name_(std::move(app_name)),
      tools_(std::make_shared<const LocalToolRegistry>(std::move(tools))) {}

AppClient::~AppClient() {
    Disconnect();
}

Result<void, Error> AppClient::Connect(const std::string& host, uint16_t port,
                                       std::chrono::milliseconds timeout) {
    auto stream = TcpConnect(host, port, timeout);
    if (stream.IsErr()) {
        return Result<void, Error>::Err(std::move(stream).Error());
    }
    Attach(std::move(stream).Value());
    LogInfo(kComponent, "Connected to proxy at " + host + ":" + std::to_string(port));
    return Result<void, Error>::Ok();
}

Result<void, Error> AppClient::ConnectWithRetry(const std::string& host, uint16_t port,
                                                int attempts,
                                                std::chrono::milliseconds interval) {
    auto result = Connect(host, port);
    for (int attempt = 2; result.IsErr() && attempt <= attempts; ++attempt) {
        LogDebug(kComponent, "Connect failed (" + result.Error().message + "), retrying in " +
                                 std::to_string(interval.count()) + "ms");
        std::this_thread::sleep_for(interval);
        result = Connect(host, port);
    }
    return result;
}

void AppClient::Attach(std::unique_ptr<IByteStream> stream) {
    auto connection = std::make_shared<Connection>(std::move(stream));
    std::shared_ptr<Connection> previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        previous = std::move(connection_);
        connection_ = std::move(connection);
    }
    if (previous) {
        previous->Close();
    }
}

Result<void, Error> AppClient::Register() {
    auto connection = CurrentConnection();
    if (!connection) {
        return Result<void, Error>::Err(
            Error::Transport("Register", app_name_, "not connected"));
    }
    return SendRegistration(connection);
}

Result<void, Error> AppClient::SetTools(LocalToolRegistry tools) {
    std::shared_ptr<Connection> connection;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tools_ = std::make_shared<const LocalToolRegistry>(std::move(tools));
        connection = connection_;
    }
    if (!connection || connection->IsClosed()) {
        return Result<void, Error>::Ok();
    }
    return SendRegistration(connection);
}

Result<void, Error> AppClient::Serve() {
    auto connection = CurrentConnection();
    if (!connection) {
        return Result<void, Error>::Err(Error::Transport("Serve", app_name_, "not connected"));
    }

    while (true) {
        auto read = connection->ReadMessage();
        if (read.status == ReadResult::Status::EndOfStream) {
            LogInfo(kComponent, "Proxy connection closed");
            return Result<void, Error>::Ok();
        }
        if (read.status == ReadResult::Status::TransportError) {
            return Result<void, Error>::Err(
                Error::Transport("Serve", connection->Peer(), read.error));
        }
        if (!read.IsMessage()) {
            LogWarn(kComponent, "Dropping malformed message: " + read.error);
            continue;
        }
        HandleMessage(*connection, read.message);
    }
}

void AppClient::Disconnect() {
    auto connection = CurrentConnection();
    if (connection) {
        connection->Close();
    }
}

bool AppClient::IsConnected() const {
    auto connection = CurrentConnection();
    return connection && !connection->IsClosed();
}

uint64_t AppClient::HandledInvocations() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handled_;
}

std::shared_ptr<Connection> AppClient::CurrentConnection() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connection_;
}

Result<void, Error> AppClient::SendRegistration(
    const std::shared_ptr<Connection>& connection) const {
    RegisterMessage message;
    message.app_name = app_name_;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        message.tools = tools_->Tools();
    }
    auto sent = connection->SendMessage(ToJson(message));
    if (sent.IsOk()) {
        LogInfo(kComponent, "Registered '" + app_name_ + "' with " +
                                std::to_string(message.tools.size()) + " tools");
    }
    return sent;
}

void AppClient::HandleMessage(Connection& connection, const nlohmann::json& message) {
    const auto type = MessageType(message);
    if (type != message_type::kToolInvocation) {
        LogWarn(kComponent, "Ignoring message of type '" + type + "'");
        return;
    }
    auto invocation = ParseToolInvocationMessage(message);
    if (invocation.IsErr()) {
        LogWarn(kComponent, invocation.Error().ToString());
        return;
    }
    const auto& call = invocation.Value();

    std::shared_ptr<const LocalToolRegistry> tools;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tools = tools_;
        ++handled_;
    }
    LogDebug(kComponent, "Invocation " + std::to_string(call.correlation_id) + ": " + call.tool);

    ToolResponseMessage response{call.correlation_id, tools->Execute(call.tool, call.parameters)};
    auto sent = connection.SendMessage(ToJson(response));
    if (sent.IsErr()) {
        LogWarn(kComponent, "Response " + std::to_string(call.correlation_id) +
                                " not delivered: " + sent.Error().ToString());
    }
}

} // namespace mcp_proxy
