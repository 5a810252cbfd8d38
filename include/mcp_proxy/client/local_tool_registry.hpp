#pragma once

#include <mcp_proxy/wire/messages.hpp>

#include <functional>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcp_proxy {

// A tool handler takes the invocation parameters (an object, empty when the
// agent sent none) and returns a ToolResult.
using ToolHandler = std::function<ToolResult(const nlohmann::json& params)>;

// ---------------------------------------------------------------------------
// LocalToolRegistry — the tools an application exposes through the proxy.
// ---------------------------------------------------------------------------
class LocalToolRegistry {
public:
    // Registering an existing name replaces its definition and handler.
    void Register(const std::string& name,
                  const std::string& description,
                  const nlohmann::json& input_schema,
                  ToolHandler handler);

    bool Unregister(const std::string& name);

    [[nodiscard]] const std::vector<ToolDefinition>& Tools() const noexcept {
        return definitions_;
    }

    [[nodiscard]] bool HasTool(const std::string& name) const;

    // Handler exceptions become {success:false, error:"Tool error: ..."}.
    [[nodiscard]] ToolResult Execute(const std::string& name,
                                     const nlohmann::json& params) const;

private:
    std::vector<ToolDefinition> definitions_;
    std::map<std::string, ToolHandler> handlers_;
};

} // namespace mcp_proxy
