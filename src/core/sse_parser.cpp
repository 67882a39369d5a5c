#include <mcp_chat/core/sse_parser.hpp>

namespace mcp_chat {

std::vector<SseEvent> SseParser::Feed(std::string_view chunk) {
    std::vector<SseEvent> events;
    for (char c : chunk) {
        if (skip_lf_) {
            skip_lf_ = false;
            if (c == '\n') continue;
        }
        if (c == '\r') {
            skip_lf_ = true;
            ProcessLine(line_, events);
            line_.clear();
        } else if (c == '\n') {
            ProcessLine(line_, events);
            line_.clear();
        } else {
            line_.push_back(c);
        }
    }
    return events;
}

void SseParser::Reset() {
    line_.clear();
    skip_lf_ = false;
    event_.clear();
    data_.clear();
    has_data_ = false;
}

void SseParser::ProcessLine(std::string_view line, std::vector<SseEvent>& out) {
    if (line.empty()) {
        // Blank line dispatches the pending event.
        if (has_data_) {
            SseEvent ev;
            if (!event_.empty()) ev.event = event_;
            ev.data = std::move(data_);
            ev.id = last_event_id_;
            out.push_back(std::move(ev));
        }
        event_.clear();
        data_.clear();
        has_data_ = false;
        return;
    }
    if (line.front() == ':') {
        return;
    }

    std::string_view field = line;
    std::string_view value;
    const auto colon = line.find(':');
    if (colon != std::string_view::npos) {
        field = line.substr(0, colon);
        value = line.substr(colon + 1);
        if (!value.empty() && value.front() == ' ') {
            value.remove_prefix(1);
        }
    }

    if (field == "data") {
        if (has_data_) data_.push_back('\n');
        data_.append(value.data(), value.size());
        has_data_ = true;
    } else if (field == "event") {
        event_.assign(value.data(), value.size());
    } else if (field == "id") {
        if (value.find('\0') == std::string_view::npos) {
            last_event_id_.assign(value.data(), value.size());
        }
    }
    // "retry" and unknown fields are ignored.
}

} // namespace mcp_chat
