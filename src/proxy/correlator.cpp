#include <mcp_proxy/proxy/correlator.hpp>

#include <mcp_proxy/core/log.hpp>

#include <vector>

namespace mcp_proxy {

namespace {

constexpr const char* kComponent = "correlator";
constexpr const char* kTimeoutError = "timeout";

} // anonymous namespace

const char* CallOutcomeName(CallOutcome outcome) {
    switch (outcome) {
        case CallOutcome::Completed:    return "completed";
        case CallOutcome::Timeout:      return "timeout";
        case CallOutcome::Disconnected: return "disconnected";
        case CallOutcome::Cancelled:    return "cancelled";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// PendingCall
// ---------------------------------------------------------------------------
PendingCall::PendingCall(CorrelationId id, ConnectionId owner, std::string tool,
                         Clock::time_point created_at)
    : id_(id), owner_(std::move(owner)), tool_(std::move(tool)),
      created_at_(created_at) {}

bool PendingCall::TryResolve(CallResolution resolution) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (resolution_.has_value()) {
            return false;
        }
        resolution_ = std::move(resolution);
    }
    resolved_cv_.notify_all();
    return true;
}

std::optional<CallResolution> PendingCall::Wait(std::chrono::milliseconds max) const {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!resolved_cv_.wait_for(lock, max, [this] { return resolution_.has_value(); })) {
        return std::nullopt;
    }
    return resolution_;
}

bool PendingCall::IsResolved() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return resolution_.has_value();
}

// ---------------------------------------------------------------------------
// Correlator
// ---------------------------------------------------------------------------
Correlator::Correlator(std::chrono::milliseconds timeout,
                       std::chrono::milliseconds sweep_interval)
    : timeout_(timeout), sweep_interval_(sweep_interval) {}

Correlator::~Correlator() {
    Stop();
}

CallHandle Correlator::BeginCall(const ConnectionId& owner, const std::string& tool,
                                 Clock::time_point now) {
    const auto id = ++last_id_;
    auto call = std::make_shared<PendingCall>(id, owner, tool, now);
    std::optional<std::string> refused;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutdown_reason_) {
            refused = shutdown_reason_;
        } else {
            pending_.emplace(id, call);
        }
    }
    if (refused) {
        call->TryResolve(CallResolution{CallOutcome::Cancelled, ToolResult::Fail(*refused)});
        return CallHandle{id, std::move(call)};
    }
    LogDebug(kComponent, "Call " + std::to_string(id) + " -> '" + tool + "' on " +
                             owner.Value());
    return CallHandle{id, std::move(call)};
}

bool Correlator::Resolve(CorrelationId id, ToolResult result) {
    auto call = Take(id);
    if (!call) {
        LogWarn(kComponent, "Ignoring response for unknown or already resolved call " +
                                std::to_string(id));
        return false;
    }
    return call->TryResolve(CallResolution{CallOutcome::Completed, std::move(result)});
}

bool Correlator::Fail(CorrelationId id, CallOutcome outcome, std::string reason) {
    auto call = Take(id);
    if (!call) {
        return false;
    }
    LogDebug(kComponent, "Call " + std::to_string(id) + " failed (" +
                             CallOutcomeName(outcome) + "): " + reason);
    return call->TryResolve(CallResolution{outcome, ToolResult::Fail(std::move(reason))});
}

bool Correlator::Expire(CorrelationId id) {
    return Fail(id, CallOutcome::Timeout, kTimeoutError);
}

size_t Correlator::FailAllFor(const ConnectionId& owner, const std::string& reason) {
    std::vector<std::shared_ptr<PendingCall>> owned;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = pending_.begin(); it != pending_.end();) {
            if (it->second->Owner() == owner) {
                owned.push_back(std::move(it->second));
                it = pending_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& call : owned) {
        call->TryResolve(CallResolution{CallOutcome::Disconnected, ToolResult::Fail(reason)});
    }
    if (!owned.empty()) {
        LogInfo(kComponent, "Failed " + std::to_string(owned.size()) +
                                " pending calls for " + owner.Value() + ": " + reason);
    }
    return owned.size();
}

size_t Correlator::FailAll(const std::string& reason) {
    std::map<CorrelationId, std::shared_ptr<PendingCall>> all;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        all.swap(pending_);
    }
    for (auto& [id, call] : all) {
        call->TryResolve(CallResolution{CallOutcome::Cancelled, ToolResult::Fail(reason)});
    }
    return all.size();
}

size_t Correlator::Shutdown(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shutdown_reason_ = reason;
    }
    return FailAll(reason);
}

size_t Correlator::ExpireOverdue(Clock::time_point now) {
    std::vector<std::shared_ptr<PendingCall>> overdue;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = pending_.begin(); it != pending_.end();) {
            if (it->second->CreatedAt() + timeout_ <= now) {
                overdue.push_back(std::move(it->second));
                it = pending_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& call : overdue) {
        LogWarn(kComponent, "Call " + std::to_string(call->Id()) + " to '" + call->Tool() +
                                "' timed out after " + std::to_string(timeout_.count()) +
                                "ms");
        call->TryResolve(CallResolution{CallOutcome::Timeout, ToolResult::Fail(kTimeoutError)});
    }
    return overdue.size();
}

size_t Correlator::PendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

void Correlator::Start() {
    std::lock_guard<std::mutex> lock(sweep_mutex_);
    if (sweeping_) {
        return;
    }
    sweeping_ = true;
    sweeper_ = std::thread([this] { SweepLoop(); });
}

void Correlator::Stop() {
    {
        std::lock_guard<std::mutex> lock(sweep_mutex_);
        if (!sweeping_) {
            return;
        }
        sweeping_ = false;
    }
    sweep_cv_.notify_all();
    if (sweeper_.joinable()) {
        sweeper_.join();
    }
}

std::shared_ptr<PendingCall> Correlator::Take(CorrelationId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(id);
    if (it == pending_.end()) {
        return nullptr;
    }
    auto call = std::move(it->second);
    pending_.erase(it);
    return call;
}

void Correlator::SweepLoop() {
    std::unique_lock<std::mutex> lock(sweep_mutex_);
    while (sweeping_) {
        sweep_cv_.wait_for(lock, sweep_interval_, [this] { return !sweeping_; });
        if (!sweeping_) break;
        lock.unlock();
        ExpireOverdue(Clock::now());
        lock.lock();
    }
}

} // namespace mcp_proxy
