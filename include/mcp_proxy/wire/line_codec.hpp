#pragma once

#include <mcp_proxy/core/result.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace mcp_proxy {

// Upper bound for a single framed message. A peer that streams more than this
// without a newline is misbehaving; its partial line is dropped.
constexpr size_t kMaxLineBytes = 16 * 1024 * 1024;

// ---------------------------------------------------------------------------
// LineFramer — reassembles newline-delimited messages from arbitrary chunks.
//
// A single Feed() may carry zero, one or many complete lines plus a trailing
// partial line; the partial line is kept until a later Feed() completes it.
// Blank lines are skipped and a trailing '\r' is stripped.
// ---------------------------------------------------------------------------
class LineFramer {
public:
    explicit LineFramer(size_t max_line_bytes = kMaxLineBytes);

    // Append raw bytes. Returns a Protocol error if the pending partial line
    // grew past the limit; the oversized data is discarded and framing resumes
    // at the next newline.
    [[nodiscard]] Result<void, Error> Feed(std::string_view bytes);

    // Next complete line, without its terminator.
    [[nodiscard]] std::optional<std::string> NextLine();

    // Bytes buffered but not yet returned as a line.
    [[nodiscard]] size_t Pending() const noexcept { return buffer_.size() - consumed_; }

private:
    void Compact();

    std::string buffer_;
    size_t consumed_ = 0;
    size_t max_line_bytes_;
    bool discarding_ = false;
};

// Serialize to compact JSON terminated by '\n'. String contents are escaped,
// so the result never contains a raw newline before the terminator.
[[nodiscard]] std::string EncodeLine(const nlohmann::json& value);

// Parse one line. Malformed JSON is a Protocol error.
[[nodiscard]] Result<nlohmann::json, Error> DecodeLine(std::string_view line);

} // namespace mcp_proxy
