#pragma once

#include <mcp_proxy/core/result.hpp>
#include <mcp_proxy/core/types.hpp>
#include <mcp_proxy/proxy/app_record.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace mcp_proxy {

class AppRegistry;

// How tool names are exposed in the aggregated catalog.
enum class ToolNaming {
    OnConflict,  // bare name unless two connected apps share it
    Qualified,   // always "qualifier:Tool"
};

[[nodiscard]] Result<ToolNaming, std::string> ParseToolNaming(std::string_view text);
[[nodiscard]] const char* ToolNamingName(ToolNaming naming);

// One tool as exposed to the agent.
struct CatalogEntry {
    std::string exposed_name;
    std::string app_name;
    ConnectionId connection_id;
    ToolDefinition tool;
};

struct RouteError {
    enum class Reason { NotFound, Ambiguous };

    Reason reason = Reason::NotFound;
    std::string message;
    std::vector<std::string> candidates;  // qualified names, for Ambiguous
};

// The tool's name without its owner's "qualifier:" or "name:" prefix. Tools
// may arrive already namespaced; they are never prefixed twice.
[[nodiscard]] std::string BareToolName(const AppRecord& app, const ToolDefinition& tool);

// "qualifier:bare".
[[nodiscard]] std::string QualifiedToolName(const AppRecord& app,
                                            const ToolDefinition& tool);

// Flatten the catalogs of all connected apps in registration order.
// Disconnected records are skipped.
[[nodiscard]] std::vector<CatalogEntry> AggregateCatalog(
    const std::vector<AppRecord>& apps, ToolNaming naming);

// Resolve a requested name to exactly one owning connection.
//
// 1. Exact match on a qualified name.
// 2. Otherwise a bare name, only when exactly one connected app owns it;
//    two or more owners yield Reason::Ambiguous, never an arbitrary pick.
[[nodiscard]] Result<ConnectionId, RouteError> ResolveTool(
    const std::string& name, const std::vector<AppRecord>& apps);

[[nodiscard]] Result<ConnectionId, RouteError> ResolveTool(
    const std::string& name, const AppRegistry& registry);

} // namespace mcp_proxy
