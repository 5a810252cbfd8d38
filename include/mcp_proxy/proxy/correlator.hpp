#pragma once

#include <mcp_proxy/core/types.hpp>
#include <mcp_proxy/proxy/app_record.hpp>
#include <mcp_proxy/wire/messages.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace mcp_proxy {

// How a forwarded call ended. Exactly one outcome per call.
enum class CallOutcome {
    Completed,     // the application answered (success or its own error)
    Timeout,       // no answer within the call timeout
    Disconnected,  // owner connection closed, or the send to it failed
    Cancelled,     // proxy shutdown
};

[[nodiscard]] const char* CallOutcomeName(CallOutcome outcome);

struct CallResolution {
    CallOutcome outcome = CallOutcome::Completed;
    ToolResult result;
};

// ---------------------------------------------------------------------------
// PendingCall — single-resolution slot for one forwarded invocation.
// ---------------------------------------------------------------------------
class PendingCall {
public:
    PendingCall(CorrelationId id, ConnectionId owner, std::string tool,
                Clock::time_point created_at);

    PendingCall(const PendingCall&) = delete;
    PendingCall& operator=(const PendingCall&) = delete;

    [[nodiscard]] CorrelationId Id() const noexcept { return id_; }
    [[nodiscard]] const ConnectionId& Owner() const noexcept { return owner_; }
    [[nodiscard]] const std::string& Tool() const noexcept { return tool_; }
    [[nodiscard]] Clock::time_point CreatedAt() const noexcept { return created_at_; }

    // First caller wins; later calls return false and change nothing.
    bool TryResolve(CallResolution resolution);

    // Block until resolved or `max` elapses.
    [[nodiscard]] std::optional<CallResolution> Wait(std::chrono::milliseconds max) const;

    [[nodiscard]] bool IsResolved() const;

private:
    const CorrelationId id_;
    const ConnectionId owner_;
    const std::string tool_;
    const Clock::time_point created_at_;

    mutable std::mutex mutex_;
    mutable std::condition_variable resolved_cv_;
    std::optional<CallResolution> resolution_;
};

struct CallHandle {
    CorrelationId id = 0;
    std::shared_ptr<PendingCall> call;
};

// ---------------------------------------------------------------------------
// Correlator — tracks in-flight invocations and bridges the asynchronous
// application response back to the waiting agent request.
//
// Every call is resolved exactly once by one of: Resolve (app answer),
// Expire/ExpireOverdue (timeout), FailAllFor (owner disconnect), FailAll or
// Shutdown (proxy shutdown). After Shutdown, BeginCall hands out calls that
// are already cancelled. A call is removed from the pending map before it is resolved,
// so a late or duplicate answer finds nothing and is a logged no-op.
//
// Start() runs a background timer that expires overdue calls every
// sweep_interval.
// ---------------------------------------------------------------------------
class Correlator {
public:
    explicit Correlator(std::chrono::milliseconds timeout,
                        std::chrono::milliseconds sweep_interval =
                            std::chrono::milliseconds(250));
    ~Correlator();

    Correlator(const Correlator&) = delete;
    Correlator& operator=(const Correlator&) = delete;

    [[nodiscard]] CallHandle BeginCall(const ConnectionId& owner, const std::string& tool,
                                       Clock::time_point now = Clock::now());

    // Deliver an application's answer. False if unknown or already resolved.
    bool Resolve(CorrelationId id, ToolResult result);

    // Resolve with a failure outcome. False if unknown or already resolved.
    bool Fail(CorrelationId id, CallOutcome outcome, std::string reason);

    // Waiter-side deadline: resolve as Timeout if still pending.
    bool Expire(CorrelationId id);

    // Fail every call owned by `owner` as Disconnected.
    size_t FailAllFor(const ConnectionId& owner,
                      const std::string& reason = "application disconnected");

    // Fail every pending call as Cancelled.
    size_t FailAll(const std::string& reason);

    // FailAll, and cancel every later BeginCall with the same reason.
    size_t Shutdown(const std::string& reason);

    // Expire calls older than the timeout. Returns how many expired.
    size_t ExpireOverdue(Clock::time_point now = Clock::now());

    [[nodiscard]] size_t PendingCount() const;
    [[nodiscard]] std::chrono::milliseconds Timeout() const noexcept { return timeout_; }

    void Start();
    void Stop();

private:
    [[nodiscard]] std::shared_ptr<PendingCall> Take(CorrelationId id);
    void SweepLoop();

    const std::chrono::milliseconds timeout_;
    const std::chrono::milliseconds sweep_interval_;
    std::atomic<CorrelationId> last_id_{0};

    mutable std::mutex mutex_;
    std::map<CorrelationId, std::shared_ptr<PendingCall>> pending_;
    std::optional<std::string> shutdown_reason_;

    std::mutex sweep_mutex_;
    std::condition_variable sweep_cv_;
    bool sweeping_ = false;
    std::thread sweeper_;
};

} // namespace mcp_proxy
