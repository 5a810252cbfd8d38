#pragma once

#include <mcp_proxy/core/result.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace mcp_proxy {

// ---------------------------------------------------------------------------
// ConnectionId — opaque identifier of one accepted application connection.
//
// Minted by the proxy as "conn-<n>" with n taken from a process-wide counter,
// so two live connections never share an id and ids are never reused.
// ---------------------------------------------------------------------------
class ConnectionId {
public:
    static Result<ConnectionId, std::string> Create(std::string_view id);

    // Mint a fresh id. Thread-safe.
    static ConnectionId Next();

    [[nodiscard]] const std::string& Value() const noexcept { return value_; }

    // Sequence number of a minted id; 0 for ids created from arbitrary text.
    [[nodiscard]] uint64_t Sequence() const noexcept { return sequence_; }

    bool operator==(const ConnectionId& other) const { return value_ == other.value_; }
    bool operator!=(const ConnectionId& other) const { return value_ != other.value_; }
    bool operator<(const ConnectionId& other) const { return value_ < other.value_; }

    ConnectionId(const ConnectionId&) = default;
    ConnectionId& operator=(const ConnectionId&) = default;
    ConnectionId(ConnectionId&&) noexcept = default;
    ConnectionId& operator=(ConnectionId&&) noexcept = default;

private:
    ConnectionId(std::string value, uint64_t sequence)
        : value_(std::move(value)), sequence_(sequence) {}
    std::string value_;
    uint64_t sequence_ = 0;
};

// ---------------------------------------------------------------------------
// AppName — name an application declares when it registers.
//
// Rules:
//   - Non-empty, max 128 bytes
//   - No ':' (reserved as the namespace separator in "App:Tool")
//   - No ASCII control characters
// ---------------------------------------------------------------------------
class AppName {
public:
    static Result<AppName, std::string> Create(std::string_view name);

    [[nodiscard]] const std::string& Value() const noexcept { return value_; }

    bool operator==(const AppName& other) const { return value_ == other.value_; }
    bool operator!=(const AppName& other) const { return value_ != other.value_; }

    AppName(const AppName&) = default;
    AppName& operator=(const AppName&) = default;
    AppName(AppName&&) noexcept = default;
    AppName& operator=(AppName&&) noexcept = default;

private:
    explicit AppName(std::string value) : value_(std::move(value)) {}
    std::string value_;
};

// Identifier of one forwarded tool invocation. Strictly increasing from 1.
using CorrelationId = int64_t;

// Separator between the application qualifier and the bare tool name.
constexpr char kNamespaceSeparator = ':';

} // namespace mcp_proxy

