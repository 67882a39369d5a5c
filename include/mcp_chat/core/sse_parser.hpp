#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace mcp_chat {

struct SseEvent {
    std::string event = "message";
    std::string data;
    std::string id;
};

// ---------------------------------------------------------------------------
// SseParser — incremental text/event-stream decoder.
//
// Bytes arrive in arbitrary chunks (httplib content receivers split wherever
// the socket read ended). Feed() buffers partial lines and returns every
// event completed by this chunk. Lines may end in LF, CRLF or CR; "data"
// lines of one event are joined with '\n'; comment lines (":") are skipped.
// An event without any data line is not dispatched.
// ---------------------------------------------------------------------------
class SseParser {
public:
    std::vector<SseEvent> Feed(std::string_view chunk);

    /// Forget buffered partial input (e.g. after a reconnect).
    void Reset();

    /// Last "id" seen on the stream, kept across events.
    [[nodiscard]] const std::string& LastEventId() const { return last_event_id_; }

private:
    void ProcessLine(std::string_view line, std::vector<SseEvent>& out);

    std::string line_;
    bool skip_lf_ = false;

    std::string event_;
    std::string data_;
    bool has_data_ = false;
    std::string last_event_id_;
};

} // namespace mcp_chat
