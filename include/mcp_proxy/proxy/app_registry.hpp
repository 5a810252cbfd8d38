#pragma once

#include <mcp_proxy/core/result.hpp>
#include <mcp_proxy/core/types.hpp>
#include <mcp_proxy/proxy/app_record.hpp>
#include <mcp_proxy/proxy/tool_router.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mcp_proxy {

// ---------------------------------------------------------------------------
// AppRegistry — live map of connection -> application -> tool catalog.
//
// Owns its synchronization: every method may be called concurrently from any
// number of connection threads. No method performs I/O, so the internal lock
// is never held across a socket operation.
//
// Disconnected records are retained for `retention` for diagnostics but are
// invisible to AllTools() and FindOwner() from the moment of Unregister().
// ---------------------------------------------------------------------------
class AppRegistry {
public:
    explicit AppRegistry(ToolNaming naming = ToolNaming::OnConflict,
                         std::chrono::seconds retention = std::chrono::hours(1));

    AppRegistry(const AppRegistry&) = delete;
    AppRegistry& operator=(const AppRegistry&) = delete;

    // Idempotent upsert. A second call for the same connection replaces the
    // catalog wholesale (never merges) and re-asserts connected=true.
    // Duplicate tool names within `tools` keep the first definition.
    // Returns true when the connection had no record before.
    bool Register(const ConnectionId& connection_id, const AppName& name,
                  std::vector<ToolDefinition> tools,
                  Clock::time_point now = Clock::now());

    // Marks the record disconnected; tool data is kept until eviction.
    // Returns false when the connection is unknown or already disconnected.
    bool Unregister(const ConnectionId& connection_id,
                    Clock::time_point now = Clock::now());

    // Record inbound activity. Unknown connections are ignored.
    void Touch(const ConnectionId& connection_id, Clock::time_point now = Clock::now());

    [[nodiscard]] std::optional<AppRecord> Get(const ConnectionId& connection_id) const;

    // All retained records, connected or not, in registration order.
    [[nodiscard]] std::vector<AppRecord> Apps() const;

    // Connected records only, in registration order.
    [[nodiscard]] std::vector<AppRecord> ConnectedApps() const;

    [[nodiscard]] size_t ConnectedCount() const;

    // Aggregated catalog across connected apps (see AggregateCatalog).
    [[nodiscard]] std::vector<CatalogEntry> AllTools() const;

    // Owner of a possibly namespaced tool name (see ResolveTool).
    [[nodiscard]] Result<ConnectionId, RouteError> FindOwner(const std::string& tool_name) const;

    // Erase disconnected records older than the retention period.
    size_t EvictDisconnected(Clock::time_point now = Clock::now());

    [[nodiscard]] ToolNaming Naming() const noexcept { return naming_; }

private:
    [[nodiscard]] std::vector<AppRecord> SnapshotLocked(bool connected_only) const;
    [[nodiscard]] std::string QualifierLocked(const ConnectionId& connection_id,
                                              const std::string& name) const;

    ToolNaming naming_;
    std::chrono::seconds retention_;
    mutable std::mutex mutex_;
    std::map<ConnectionId, AppRecord> apps_;
    uint64_t next_order_ = 0;
};

} // namespace mcp_proxy
