#include <mcp_proxy/wire/line_codec.hpp>

namespace mcp_proxy {

LineFramer::LineFramer(size_t max_line_bytes) : max_line_bytes_(max_line_bytes) {}

Result<void, Error> LineFramer::Feed(std::string_view bytes) {
    if (discarding_) {
        auto nl = bytes.find('\n');
        if (nl == std::string_view::npos) {
            return Result<void, Error>::Ok();
        }
        discarding_ = false;
        bytes.remove_prefix(nl + 1);
    }

    Compact();
    buffer_.append(bytes.data(), bytes.size());

    // Only the tail after the last newline can be an unterminated line.
    auto last_nl = buffer_.rfind('\n');
    size_t tail_start = (last_nl == std::string::npos) ? consumed_ : last_nl + 1;
    if (buffer_.size() - tail_start > max_line_bytes_) {
        auto dropped = buffer_.size() - tail_start;
        buffer_.erase(tail_start);
        discarding_ = true;
        return Result<void, Error>::Err(Error::Protocol(
            "LineFramer",
            "Line exceeds " + std::to_string(max_line_bytes_) +
                " bytes; dropped " + std::to_string(dropped) + " bytes"));
    }
    return Result<void, Error>::Ok();
}

std::optional<std::string> LineFramer::NextLine() {
    while (consumed_ < buffer_.size()) {
        auto nl = buffer_.find('\n', consumed_);
        if (nl == std::string::npos) {
            return std::nullopt;
        }
        std::string line = buffer_.substr(consumed_, nl - consumed_);
        consumed_ = nl + 1;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.find_first_not_of(" \t") == std::string::npos) {
            continue;
        }
        return line;
    }
    return std::nullopt;
}

void LineFramer::Compact() {
    if (consumed_ > 0) {
        buffer_.erase(0, consumed_);
        consumed_ = 0;
    }
}

std::string EncodeLine(const nlohmann::json& value) {
    auto text = value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    text.push_back('\n');
    return text;
}

Result<nlohmann::json, Error> DecodeLine(std::string_view line) {
    try {
        return Result<nlohmann::json, Error>::Ok(
            nlohmann::json::parse(line.begin(), line.end()));
    } catch (const nlohmann::json::parse_error& e) {
        return Result<nlohmann::json, Error>::Err(
            Error::Protocol("DecodeLine", std::string("Malformed JSON: ") + e.what()));
    }
}

} // namespace mcp_proxy
