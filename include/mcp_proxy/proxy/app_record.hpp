#pragma once

#include <mcp_proxy/core/types.hpp>
#include <mcp_proxy/wire/messages.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace mcp_proxy {

using Clock = std::chrono::steady_clock;

// ---------------------------------------------------------------------------
// AppRecord — registry entry for one application connection.
//
// `qualifier` is the namespace prefix used in "qualifier:Tool". It equals the
// declared name unless another live connection already held that name at
// registration time, in which case it is "name#<connection sequence>".
// ---------------------------------------------------------------------------
struct AppRecord {
    ConnectionId connection_id;
    std::string name;
    std::string qualifier;
    std::vector<ToolDefinition> tools;
    Clock::time_point registered_at;
    Clock::time_point last_activity_at;
    std::optional<Clock::time_point> disconnected_at;
    bool connected = false;
    uint64_t order = 0;  // first-registration order, for stable listings
};

} // namespace mcp_proxy
