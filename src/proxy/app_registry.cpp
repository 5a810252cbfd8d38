#include <mcp_proxy/proxy/app_registry.hpp>

#include <mcp_proxy/core/log.hpp>

#include <algorithm>
#include <set>

namespace mcp_proxy {

namespace {

constexpr const char* kComponent = "registry";

// "Foo:Ping" and "Ping" on app Foo are one tool; the first definition wins.
// Names of the dropped entries are appended to `dropped`.
std::vector<ToolDefinition> DropDuplicateTools(const AppRecord& app,
                                               std::vector<ToolDefinition> tools,
                                               std::vector<std::string>& dropped) {
    std::set<std::string> seen;
    std::vector<ToolDefinition> unique;
    unique.reserve(tools.size());
    for (auto& tool : tools) {
        if (!seen.insert(BareToolName(app, tool)).second) {
            dropped.push_back(tool.name);
            continue;
        }
        unique.push_back(std::move(tool));
    }
    return unique;
}

} // anonymous namespace

AppRegistry::AppRegistry(ToolNaming naming, std::chrono::seconds retention)
    : naming_(naming), retention_(retention) {}

bool AppRegistry::Register(const ConnectionId& connection_id, const AppName& name,
                           std::vector<ToolDefinition> tools, Clock::time_point now) {
    bool created = false;
    std::string qualifier;
    size_t tool_count = 0;
    std::vector<std::string> dropped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = apps_.find(connection_id);
        if (it == apps_.end()) {
            AppRecord record{connection_id,
                             name.Value(),
                             QualifierLocked(connection_id, name.Value()),
                             {},
                             now,
                             now,
                             std::nullopt,
                             true,
                             ++next_order_};
            record.tools = DropDuplicateTools(record, std::move(tools), dropped);
            tool_count = record.tools.size();
            qualifier = record.qualifier;
            apps_.emplace(connection_id, std::move(record));
            created = true;
        } else {
            auto& record = it->second;
            if (record.name != name.Value() || !record.connected) {
                record.qualifier = QualifierLocked(connection_id, name.Value());
            }
            record.name = name.Value();
            record.tools = DropDuplicateTools(record, std::move(tools), dropped);
            tool_count = record.tools.size();
            record.registered_at = now;
            record.last_activity_at = now;
            record.disconnected_at.reset();
            record.connected = true;
            qualifier = record.qualifier;
        }
    }

    for (const auto& tool : dropped) {
        LogWarn(kComponent, "App '" + name.Value() + "' declared tool '" + tool +
                                "' more than once; keeping the first definition");
    }
    LogInfo(kComponent, std::string(created ? "Registered" : "Re-registered") +
                            " app '" + name.Value() + "' as '" + qualifier + "' with " +
                            std::to_string(tool_count) + " tools (connection: " +
                            connection_id.Value() + ")");
    return created;
}

bool AppRegistry::Unregister(const ConnectionId& connection_id, Clock::time_point now) {
    std::string name;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = apps_.find(connection_id);
        if (it == apps_.end() || !it->second.connected) {
            return false;
        }
        it->second.connected = false;
        it->second.disconnected_at = now;
        name = it->second.name;
    }
    LogInfo(kComponent, "Marked app '" + name + "' as disconnected (connection: " +
                            connection_id.Value() + ")");
    return true;
}

void AppRegistry::Touch(const ConnectionId& connection_id, Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = apps_.find(connection_id);
    if (it != apps_.end()) {
        it->second.last_activity_at = now;
    }
}

std::optional<AppRecord> AppRegistry::Get(const ConnectionId& connection_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = apps_.find(connection_id);
    if (it == apps_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<AppRecord> AppRegistry::Apps() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return SnapshotLocked(false);
}

std::vector<AppRecord> AppRegistry::ConnectedApps() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return SnapshotLocked(true);
}

size_t AppRegistry::ConnectedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(std::count_if(
        apps_.begin(), apps_.end(),
        [](const auto& entry) { return entry.second.connected; }));
}

std::vector<CatalogEntry> AppRegistry::AllTools() const {
    return AggregateCatalog(ConnectedApps(), naming_);
}

Result<ConnectionId, RouteError> AppRegistry::FindOwner(const std::string& tool_name) const {
    return ResolveTool(tool_name, ConnectedApps());
}

size_t AppRegistry::EvictDisconnected(Clock::time_point now) {
    size_t evicted = 0;
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = apps_.begin(); it != apps_.end();) {
        const auto& record = it->second;
        if (!record.connected && record.disconnected_at &&
            *record.disconnected_at + retention_ <= now) {
            it = apps_.erase(it);
            ++evicted;
        } else {
            ++it;
        }
    }
    return evicted;
}

std::vector<AppRecord> AppRegistry::SnapshotLocked(bool connected_only) const {
    std::vector<AppRecord> out;
    out.reserve(apps_.size());
    for (const auto& [id, record] : apps_) {
        if (connected_only && !record.connected) continue;
        out.push_back(record);
    }
    std::sort(out.begin(), out.end(),
              [](const AppRecord& a, const AppRecord& b) { return a.order < b.order; });
    return out;
}

std::string AppRegistry::QualifierLocked(const ConnectionId& connection_id,
                                         const std::string& name) const {
    for (const auto& [id, record] : apps_) {
        if (id == connection_id || !record.connected) continue;
        if (record.name == name || record.qualifier == name) {
            const auto n = connection_id.Sequence() != 0 ? connection_id.Sequence()
                                                         : next_order_ + 1;
            return name + "#" + std::to_string(n);
        }
    }
    return name;
}

} // namespace mcp_proxy
