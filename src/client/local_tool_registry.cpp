#include <mcp_proxy/client/local_tool_registry.hpp>

#include <algorithm>

namespace mcp_proxy {

void LocalToolRegistry::Register(const std::string& name,
                                 const std::string& description,
                                 const nlohmann::json& input_schema,
                                 ToolHandler handler) {
    ToolDefinition definition{name, description,
                              input_schema.is_null() ? nlohmann::json{{"type", "object"}}
                                                     : input_schema};
    auto it = std::find_if(definitions_.begin(), definitions_.end(),
                           [&](const ToolDefinition& d) { return d.name == name; });
    if (it != definitions_.end()) {
        *it = std::move(definition);
    } else {
        definitions_.push_back(std::move(definition));
    }
    handlers_[name] = std::move(handler);
}

bool LocalToolRegistry::Unregister(const std::string& name) {
    if (handlers_.erase(name) == 0) {
        return false;
    }
    definitions_.erase(std::remove_if(definitions_.begin(), definitions_.end(),
                                      [&](const ToolDefinition& d) { return d.name == name; }),
                       definitions_.end());
    return true;
}

bool LocalToolRegistry::HasTool(const std::string& name) const {
    return handlers_.count(name) > 0;
}

ToolResult LocalToolRegistry::Execute(const std::string& name,
                                      const nlohmann::json& params) const {
    auto it = handlers_.find(name);
    if (it == handlers_.end()) {
        return ToolResult::Fail("Unknown tool: " + name);
    }

    try {
        return it->second(params.is_null() ? nlohmann::json::object() : params);
    } catch (const std::exception& e) {
        return ToolResult::Fail(std::string("Tool error: ") + e.what());
    }
}

} // namespace mcp_proxy
