#include <mcp_proxy/proxy/tool_router.hpp>

#include <mcp_proxy/proxy/app_registry.hpp>

#include <map>

namespace mcp_proxy {

namespace {

bool HasPrefix(const std::string& text, const std::string& prefix) {
    return text.size() > prefix.size() &&
           text.compare(0, prefix.size(), prefix) == 0;
}

std::string JoinCandidates(const std::vector<std::string>& names) {
    std::string out;
    for (const auto& name : names) {
        if (!out.empty()) out += ", ";
        out += name;
    }
    return out;
}

} // anonymous namespace

Result<ToolNaming, std::string> ParseToolNaming(std::string_view text) {
    if (text == "on_conflict") {
        return Result<ToolNaming, std::string>::Ok(ToolNaming::OnConflict);
    }
    if (text == "qualified") {
        return Result<ToolNaming, std::string>::Ok(ToolNaming::Qualified);
    }
    return Result<ToolNaming, std::string>::Err(
        "Unknown tool naming '" + std::string(text) +
        "' (expected on_conflict or qualified)");
}

const char* ToolNamingName(ToolNaming naming) {
    switch (naming) {
        case ToolNaming::OnConflict: return "on_conflict";
        case ToolNaming::Qualified:  return "qualified";
    }
    return "on_conflict";
}

std::string BareToolName(const AppRecord& app, const ToolDefinition& tool) {
    for (const auto* prefix : {&app.qualifier, &app.name}) {
        const auto full = *prefix + kNamespaceSeparator;
        if (!prefix->empty() && HasPrefix(tool.name, full)) {
            return tool.name.substr(full.size());
        }
    }
    return tool.name;
}

std::string QualifiedToolName(const AppRecord& app, const ToolDefinition& tool) {
    return app.qualifier + kNamespaceSeparator + BareToolName(app, tool);
}

std::vector<CatalogEntry> AggregateCatalog(const std::vector<AppRecord>& apps,
                                           ToolNaming naming) {
    std::map<std::string, int> owners;
    if (naming == ToolNaming::OnConflict) {
        for (const auto& app : apps) {
            if (!app.connected) continue;
            for (const auto& tool : app.tools) {
                ++owners[BareToolName(app, tool)];
            }
        }
    }

    std::vector<CatalogEntry> catalog;
    for (const auto& app : apps) {
        if (!app.connected) continue;
        for (const auto& tool : app.tools) {
            auto bare = BareToolName(app, tool);
            bool qualify = naming == ToolNaming::Qualified || owners[bare] > 1;
            catalog.push_back(CatalogEntry{
                qualify ? QualifiedToolName(app, tool) : bare,
                app.name,
                app.connection_id,
                tool,
            });
        }
    }
    return catalog;
}

Result<ConnectionId, RouteError> ResolveTool(const std::string& name,
                                             const std::vector<AppRecord>& apps) {
    using R = Result<ConnectionId, RouteError>;

    std::vector<const AppRecord*> qualified_hits;
    std::vector<const AppRecord*> bare_hits;
    std::vector<std::string> bare_candidates;

    for (const auto& app : apps) {
        if (!app.connected) continue;
        bool qualified_hit = false;
        bool bare_hit = false;
        for (const auto& tool : app.tools) {
            if (QualifiedToolName(app, tool) == name) qualified_hit = true;
            if (BareToolName(app, tool) == name) {
                bare_hit = true;
                bare_candidates.push_back(QualifiedToolName(app, tool));
            }
        }
        if (qualified_hit) qualified_hits.push_back(&app);
        if (bare_hit) bare_hits.push_back(&app);
    }

    if (qualified_hits.size() == 1) {
        return R::Ok(qualified_hits.front()->connection_id);
    }
    if (qualified_hits.size() > 1) {
        std::vector<std::string> ids;
        for (const auto* app : qualified_hits) ids.push_back(app->connection_id.Value());
        return R::Err(RouteError{RouteError::Reason::Ambiguous,
                                 "Tool '" + name + "' is ambiguous across connections: " +
                                     JoinCandidates(ids),
                                 ids});
    }

    if (bare_hits.size() == 1) {
        return R::Ok(bare_hits.front()->connection_id);
    }
    if (bare_hits.size() > 1) {
        return R::Err(RouteError{RouteError::Reason::Ambiguous,
                                 "Tool '" + name + "' is ambiguous; use one of: " +
                                     JoinCandidates(bare_candidates),
                                 bare_candidates});
    }

    return R::Err(RouteError{RouteError::Reason::NotFound,
                             "Tool not found: " + name, {}});
}

Result<ConnectionId, RouteError> ResolveTool(const std::string& name,
                                             const AppRegistry& registry) {
    return ResolveTool(name, registry.ConnectedApps());
}

} // namespace mcp_proxy
