#include <mcp_proxy/core/types.hpp>

#include <atomic>

namespace mcp_proxy {

namespace {

constexpr size_t kMaxAppNameLength = 128;

std::atomic<uint64_t>& ConnectionCounter() {
    static std::atomic<uint64_t> counter{0};
    return counter;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// ConnectionId
// ---------------------------------------------------------------------------
Result<ConnectionId, std::string> ConnectionId::Create(std::string_view id) {
    if (id.empty()) {
        return Result<ConnectionId, std::string>::Err(
            "Connection id must not be empty");
    }
    return Result<ConnectionId, std::string>::Ok(
        ConnectionId(std::string(id), 0));
}

ConnectionId ConnectionId::Next() {
    const auto n = ConnectionCounter().fetch_add(1) + 1;
    return ConnectionId("conn-" + std::to_string(n), n);
}

// ---------------------------------------------------------------------------
// AppName
// ---------------------------------------------------------------------------
Result<AppName, std::string> AppName::Create(std::string_view name) {
    if (name.empty()) {
        return Result<AppName, std::string>::Err("Application name must not be empty");
    }
    if (name.size() > kMaxAppNameLength) {
        return Result<AppName, std::string>::Err(
            "Application name exceeds " + std::to_string(kMaxAppNameLength) +
            " bytes");
    }
    for (char c : name) {
        if (c == kNamespaceSeparator) {
            return Result<AppName, std::string>::Err(
                "Application name must not contain ':': " + std::string(name));
        }
        if (static_cast<unsigned char>(c) < 0x20 || c == 0x7f) {
            return Result<AppName, std::string>::Err(
                "Application name contains a control character");
        }
    }
    return Result<AppName, std::string>::Ok(AppName(std::string(name)));
}

} // namespace mcp_proxy
