#include <mcp_proxy/proxy/proxy_server.hpp>

#include <mcp_proxy/core/log.hpp>
#include <mcp_proxy/wire/messages.hpp>

#include <algorithm>
#include <system_error>

namespace mcp_proxy {

namespace {

constexpr const char* kComponent = "proxy";
constexpr auto kAcceptTick = std::chrono::milliseconds(100);
constexpr auto kHousekeepingInterval = std::chrono::seconds(1);
constexpr auto kReaderPoll = std::chrono::milliseconds(10);

} // anonymous namespace

ProxyServer::ProxyServer(ProxyConfig config, std::unique_ptr<IByteStream> agent_stream)
    : config_(std::move(config)),
      registry_(config_.tool_naming, config_.retention),
      correlator_(config_.call_timeout, config_.sweep_interval),
      agent_(std::make_shared<Connection>(std::move(agent_stream))),
      handler_(registry_, correlator_,
               [this](const ConnectionId& id, const nlohmann::json& message) {
                   return SendToApp(id, message);
               }) {}

ProxyServer::~ProxyServer() {
    Stop();
}

Result<void, Error> ProxyServer::Start() {
    if (started_.load()) {
        return Result<void, Error>::Ok();
    }
    auto listener = TcpListener::Bind(config_.bind.host, config_.bind.port);
    if (listener.IsErr()) {
        return Result<void, Error>::Err(std::move(listener).Error());
    }
    listener_ = std::move(listener).Value();

    correlator_.Start();
    started_ = true;
    accept_thread_ = std::thread(&ProxyServer::AcceptLoop, this);

    LogInfo(kComponent, "Listening for applications on " + listener_->Host() + ":" +
                            std::to_string(listener_->Port()) + " (max " +
                            std::to_string(config_.max_connections) + " connections, " +
                            ToolNamingName(config_.tool_naming) + " naming)");
    return Result<void, Error>::Ok();
}

Result<void, Error> ProxyServer::Run() {
    auto started = Start();
    if (started.IsErr()) {
        return started;
    }

    LogInfo(kComponent, "Serving agent on " + agent_->Peer());
    while (!stop_requested_.load()) {
        auto read = agent_->ReadMessage();
        if (read.IsMessage()) {
            HandleAgentMessage(read.message);
            continue;
        }
        if (read.status == ReadResult::Status::Malformed) {
            LogWarn(kComponent, "Malformed agent message: " + read.error);
            SendToAgent(AgentHandler::ParseErrorReply(read.error));
            continue;
        }
        if (read.status == ReadResult::Status::TransportError) {
            LogError(kComponent, "Agent channel failed: " + read.error);
        } else if (!stop_requested_.load()) {
            LogInfo(kComponent, "Agent channel closed");
        }
        break;
    }

    Stop();
    return Result<void, Error>::Ok();
}

void ProxyServer::RequestStop() noexcept {
    stop_requested_.store(true);
}

void ProxyServer::Stop() {
    if (stopped_.exchange(true)) {
        return;
    }
    stop_requested_ = true;
    const auto deadline = Clock::now() + config_.shutdown_timeout;
    LogInfo(kComponent, "Shutting down");

    // 1. Stop accepting.
    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }
    if (listener_) {
        listener_->Close();
    }

    // 2. Nobody will answer in-flight calls any more.
    auto cancelled = correlator_.Shutdown("proxy shutting down");
    if (cancelled > 0) {
        LogInfo(kComponent, "Cancelled " + std::to_string(cancelled) + " pending call(s)");
    }
    correlator_.Stop();

    // 3. Close every application connection and wait for its reader.
    std::vector<std::shared_ptr<AppSession>> sessions;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        for (const auto& entry : sessions_) {
            sessions.push_back(entry.second);
        }
    }
    for (const auto& session : sessions) {
        session->connection->Close();
    }
    for (const auto& session : sessions) {
        while (!session->finished.load() && Clock::now() < deadline) {
            std::this_thread::sleep_for(kReaderPoll);
        }
        if (!session->finished.load()) {
            LogWarn(kComponent, "Reader for " + session->id.Value() +
                                    " did not finish before the shutdown deadline");
        }
    }
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        for (auto& entry : sessions_) {
            if (entry.second->reader.joinable()) {
                entry.second->reader.join();
            }
        }
        sessions_.clear();
    }

    // 4. Let call tasks deliver their (failed) replies.
    std::vector<std::future<void>> tasks;
    {
        std::lock_guard<std::mutex> lock(calls_mutex_);
        tasks.swap(call_tasks_);
    }
    for (auto& task : tasks) {
        if (task.wait_until(deadline) != std::future_status::ready) {
            LogWarn(kComponent, "Call task still running at the shutdown deadline");
        }
    }
    tasks.clear();

    agent_->Close();
    LogInfo(kComponent, "Stopped");
}

uint16_t ProxyServer::BoundPort() const {
    return listener_ ? listener_->Port() : 0;
}

size_t ProxyServer::OpenConnections() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return static_cast<size_t>(std::count_if(
        sessions_.begin(), sessions_.end(),
        [](const auto& entry) { return !entry.second->finished.load(); }));
}

// ---------------------------------------------------------------------------
// Application side
// ---------------------------------------------------------------------------
void ProxyServer::AcceptLoop() {
    auto last_housekeeping = Clock::now();
    while (!stop_requested_.load()) {
        auto accepted = listener_->Accept(kAcceptTick);
        if (accepted.IsErr()) {
            LogWarn(kComponent, accepted.Error().ToString());
            std::this_thread::sleep_for(kAcceptTick);
        } else if (auto stream = std::move(accepted).Value()) {
            AdmitApp(std::move(stream));
        }

        if (Clock::now() - last_housekeeping >= kHousekeepingInterval) {
            Housekeeping();
            last_housekeeping = Clock::now();
        }
    }
    // Wakes Run() when the stop came from a signal. The write side stays open
    // until Stop() has delivered the cancelled replies.
    agent_->ShutdownRead();
}

void ProxyServer::AdmitApp(std::unique_ptr<FdStream> stream) {
    const auto peer = stream->Describe();
    if (OpenConnections() >= static_cast<size_t>(config_.max_connections)) {
        LogWarn(kComponent, "Rejecting connection from " + peer + ": limit of " +
                                std::to_string(config_.max_connections) + " reached");
        stream->Close();
        return;
    }

    // A peer that stops reading must not hold a call task past its timeout.
    stream->SetWriteTimeout(config_.call_timeout);
    auto session = std::make_shared<AppSession>(
        ConnectionId::Next(), std::make_shared<Connection>(std::move(stream)));
    LogInfo(kComponent, "Accepted " + session->id.Value() + " from " + peer);

    std::lock_guard<std::mutex> lock(sessions_mutex_);
    sessions_.emplace(session->id, session);
    session->reader = std::thread([this, session] { ServeApp(session); });
}

void ProxyServer::ServeApp(const std::shared_ptr<AppSession>& session) {
    const auto& id = session->id;
    bool registered = false;

    while (true) {
        auto read = session->connection->ReadMessage();
        if (read.IsTerminal()) {
            if (read.status == ReadResult::Status::TransportError) {
                LogWarn(kComponent, id.Value() + ": " + read.error);
            }
            break;
        }
        if (!read.IsMessage()) {
            LogWarn(kComponent, id.Value() + ": dropping malformed message: " + read.error);
            continue;
        }
        registry_.Touch(id);
        HandleAppMessage(*session, read.message, registered);
    }

    // Close first so a concurrent forward fails fast instead of writing into
    // a dead socket, then fail whatever is still owned by this connection.
    session->connection->Close();
    registry_.Unregister(id);
    auto failed = correlator_.FailAllFor(id);
    LogInfo(kComponent, id.Value() + " disconnected" +
                            (failed > 0 ? "; failed " + std::to_string(failed) +
                                              " pending call(s)"
                                        : std::string()));
    session->finished = true;
}

void ProxyServer::HandleAppMessage(const AppSession& session,
                                   const nlohmann::json& message, bool& registered) {
    const auto& id = session.id;
    auto parsed = ParseAppMessage(message);
    if (parsed.IsErr()) {
        LogWarn(kComponent, id.Value() + (registered ? ": " : " (unregistered): ") +
                                parsed.Error().message);
        return;
    }
    auto app_message = std::move(parsed).Value();

    if (auto* reg = std::get_if<RegisterMessage>(&app_message)) {
        auto name = AppName::Create(reg->app_name);
        if (name.IsErr()) {
            LogWarn(kComponent, id.Value() + ": rejected registration: " + name.Error());
            return;
        }
        if (!IsExpectedApp(name.Value().Value())) {
            LogWarn(kComponent, "App '" + name.Value().Value() +
                                    "' is not in the configured apps list");
        }
        registry_.Register(id, name.Value(), std::move(reg->tools));
        registered = true;
        return;
    }

    auto& response = std::get<ToolResponseMessage>(app_message);
    if (!registered) {
        LogWarn(kComponent, id.Value() + ": ignoring toolResponse before registration");
        return;
    }
    correlator_.Resolve(response.correlation_id, std::move(response.result));
}

Result<void, Error> ProxyServer::SendToApp(const ConnectionId& id,
                                           const nlohmann::json& message) {
    std::shared_ptr<Connection> connection;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = sessions_.find(id);
        if (it != sessions_.end()) {
            connection = it->second->connection;
        }
    }
    if (!connection) {
        return Result<void, Error>::Err(
            Error::Transport("SendToApp", id.Value(), "connection is gone"));
    }
    auto sent = connection->SendMessage(message);
    if (sent.IsErr() && !connection->IsClosed()) {
        // The line may be half written; the stream is unusable. The reader
        // sees the close and fails this connection's pending calls.
        LogWarn(kComponent, id.Value() + ": closing after failed send: " +
                                sent.Error().message);
        connection->Close();
    }
    return sent;
}

// ---------------------------------------------------------------------------
// Agent side
// ---------------------------------------------------------------------------
void ProxyServer::HandleAgentMessage(const nlohmann::json& message) {
    auto outcome = handler_.HandleMessage(message);
    if (auto* reply = std::get_if<nlohmann::json>(&outcome)) {
        SendToAgent(*reply);
    } else if (auto* pending = std::get_if<PendingReply>(&outcome)) {
        DispatchReply(std::move(*pending));
    }
}

void ProxyServer::DispatchReply(PendingReply pending) {
    std::lock_guard<std::mutex> lock(calls_mutex_);
    call_tasks_.erase(
        std::remove_if(call_tasks_.begin(), call_tasks_.end(),
                       [](const std::future<void>& task) {
                           return task.wait_for(std::chrono::seconds(0)) ==
                                  std::future_status::ready;
                       }),
        call_tasks_.end());

    const auto id = pending.request_id;
    try {
        call_tasks_.push_back(std::async(std::launch::async,
                                         [this, pending = std::move(pending)] {
                                             SendToAgent(handler_.Forward(pending));
                                         }));
    } catch (const std::system_error& e) {
        LogError(kComponent, std::string("Cannot start call task: ") + e.what());
        SendToAgent(AgentHandler::MakeError(id, rpc_error::kCancelled, "proxy overloaded"));
    }
}

void ProxyServer::SendToAgent(const nlohmann::json& reply) {
    auto sent = agent_->SendMessage(reply);
    if (sent.IsErr()) {
        LogDebug(kComponent, "Reply not delivered: " + sent.Error().ToString());
    }
}

// ---------------------------------------------------------------------------
// Housekeeping
// ---------------------------------------------------------------------------
void ProxyServer::Housekeeping() {
    ReapFinishedSessions();
    auto evicted = registry_.EvictDisconnected();
    if (evicted > 0) {
        LogDebug(kComponent, "Evicted " + std::to_string(evicted) +
                                 " disconnected app record(s)");
    }
}

void ProxyServer::ReapFinishedSessions() {
    std::vector<std::shared_ptr<AppSession>> finished;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        for (auto it = sessions_.begin(); it != sessions_.end();) {
            if (it->second->finished.load()) {
                finished.push_back(it->second);
                it = sessions_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& session : finished) {
        if (session->reader.joinable()) {
            session->reader.join();
        }
    }
}

bool ProxyServer::IsExpectedApp(const std::string& name) const {
    if (config_.apps.empty()) {
        return true;
    }
    return std::any_of(config_.apps.begin(), config_.apps.end(),
                       [&](const ExpectedApp& app) { return app.name == name; });
}

} // namespace mcp_proxy
