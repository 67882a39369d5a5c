#include <mcp_chat/chat/message.hpp>

#include <mcp_chat/mcp/server_descriptor.hpp>

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace mcp_chat {

namespace {

Error MakeMessageError(const std::string& message) {
    return Error{"ParseMessage", "", std::nullopt, message, std::nullopt,
                 ErrorCategory::Storage};
}

std::string Dump(const nlohmann::json& j) {
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

nlohmann::json OptionalString(const std::optional<std::string>& value) {
    if (value.has_value()) return *value;
    return nullptr;
}

std::optional<std::string> StringOrNull(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

} // anonymous namespace

const char* RoleName(Role role) {
    switch (role) {
        case Role::System: return "system";
        case Role::User: return "user";
        case Role::Assistant: return "assistant";
        case Role::Tool: return "tool";
    }
    return "user";
}

std::optional<Role> ParseRole(const std::string& name) {
    if (name == "system") return Role::System;
    if (name == "user") return Role::User;
    if (name == "assistant") return Role::Assistant;
    if (name == "tool") return Role::Tool;
    return std::nullopt;
}

std::string ToolCallRequest::FullName() const {
    if (server_name.empty()) return function_name.empty() ? tool_name : function_name;
    return server_name + kToolNameSeparator + tool_name;
}

// ---------------------------------------------------------------------------
// Factories
// ---------------------------------------------------------------------------
ConversationMessage ConversationMessage::System(std::string text) {
    ConversationMessage m;
    m.role = Role::System;
    m.content = std::move(text);
    return m;
}

ConversationMessage ConversationMessage::User(std::string text) {
    ConversationMessage m;
    m.role = Role::User;
    m.content = std::move(text);
    return m;
}

ConversationMessage ConversationMessage::Assistant(std::optional<std::string> text,
                                                   std::vector<ToolCallRequest> calls) {
    ConversationMessage m;
    m.role = Role::Assistant;
    m.content = std::move(text);
    m.tool_calls = std::move(calls);
    return m;
}

ConversationMessage ConversationMessage::Tool(std::string call_id,
                                              std::string full_name,
                                              std::string payload) {
    ConversationMessage m;
    m.role = Role::Tool;
    m.content = std::move(payload);
    m.tool_call_id = std::move(call_id);
    m.name = std::move(full_name);
    return m;
}

// ---------------------------------------------------------------------------
// Serialization
// ---------------------------------------------------------------------------
nlohmann::json ConversationMessage::ToModelFormat() const {
    nlohmann::json j;
    j["role"] = RoleName(role);
    if (content.has_value()) {
        j["content"] = *content;
    }
    if (!tool_calls.empty()) {
        auto calls = nlohmann::json::array();
        for (const auto& call : tool_calls) {
            calls.push_back({
                {"id", call.id},
                {"type", "function"},
                {"function", {
                    {"name", call.FullName()},
                    {"arguments", Dump(call.arguments)},
                }},
            });
        }
        j["tool_calls"] = std::move(calls);
    }
    if (tool_call_id.has_value()) {
        j["tool_call_id"] = *tool_call_id;
    }
    if (name.has_value()) {
        j["name"] = *name;
    }
    return j;
}

nlohmann::json ConversationMessage::ToJson() const {
    nlohmann::json j;
    j["role"] = RoleName(role);
    j["content"] = OptionalString(content);
    auto calls = nlohmann::json::array();
    for (const auto& call : tool_calls) {
        nlohmann::json c = {
            {"id", call.id},
            {"server_name", call.server_name},
            {"tool_name", call.tool_name},
            {"arguments", call.arguments},
        };
        if (!call.function_name.empty() && call.function_name != call.FullName()) {
            c["function_name"] = call.function_name;
        }
        calls.push_back(std::move(c));
    }
    j["tool_calls"] = std::move(calls);
    j["tool_call_id"] = OptionalString(tool_call_id);
    j["name"] = OptionalString(name);
    j["timestamp"] = FormatTimestamp(timestamp);
    return j;
}

Result<ConversationMessage, Error> ConversationMessage::FromJson(const nlohmann::json& j) {
    using R = Result<ConversationMessage, Error>;
    if (!j.is_object()) {
        return R::Err(MakeMessageError("Message is not a JSON object"));
    }
    auto role_name = StringOrNull(j, "role");
    if (!role_name.has_value()) {
        return R::Err(MakeMessageError("Message has no role"));
    }
    auto role = ParseRole(*role_name);
    if (!role.has_value()) {
        return R::Err(MakeMessageError("Unknown message role: " + *role_name));
    }

    ConversationMessage m;
    m.role = *role;
    m.content = StringOrNull(j, "content");
    m.tool_call_id = StringOrNull(j, "tool_call_id");
    m.name = StringOrNull(j, "name");

    if (j.contains("tool_calls") && j["tool_calls"].is_array()) {
        for (const auto& c : j["tool_calls"]) {
            if (!c.is_object()) {
                return R::Err(MakeMessageError("Tool call is not a JSON object"));
            }
            ToolCallRequest call;
            call.id = StringOrNull(c, "id").value_or("");
            call.server_name = StringOrNull(c, "server_name").value_or("");
            call.tool_name = StringOrNull(c, "tool_name").value_or("");
            call.function_name = StringOrNull(c, "function_name").value_or("");
            if (c.contains("arguments") && c["arguments"].is_object()) {
                call.arguments = c["arguments"];
            }
            if (call.function_name.empty()) {
                call.function_name = call.FullName();
            }
            m.tool_calls.push_back(std::move(call));
        }
    }

    if (auto ts = StringOrNull(j, "timestamp")) {
        auto parsed = ParseTimestamp(*ts);
        if (parsed.IsErr()) {
            return R::Err(std::move(parsed).Error());
        }
        m.timestamp = parsed.Value();
    }
    return R::Ok(std::move(m));
}

// ---------------------------------------------------------------------------
// Timestamps
// ---------------------------------------------------------------------------
std::string FormatTimestamp(std::chrono::system_clock::time_point tp) {
    const auto time_t_value = std::chrono::system_clock::to_time_t(tp);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        tp.time_since_epoch()) % 1000;
    std::tm utc{};
    gmtime_r(&time_t_value, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count()
        << 'Z';
    return oss.str();
}

Result<std::chrono::system_clock::time_point, Error> ParseTimestamp(
    const std::string& text) {
    using R = Result<std::chrono::system_clock::time_point, Error>;

    std::tm utc{};
    std::istringstream iss(text);
    iss >> std::get_time(&utc, "%Y-%m-%dT%H:%M:%S");
    if (iss.fail()) {
        return R::Err(MakeMessageError("Invalid timestamp: " + text));
    }

    std::chrono::milliseconds fraction{0};
    if (iss.peek() == '.') {
        iss.get();
        std::string digits;
        while (std::isdigit(iss.peek())) {
            digits.push_back(static_cast<char>(iss.get()));
        }
        if (digits.empty()) {
            return R::Err(MakeMessageError("Invalid timestamp: " + text));
        }
        digits.resize(3, '0');
        fraction = std::chrono::milliseconds(std::stoi(digits));
    }

    // Trailing "Z" or "+00:00" both mean UTC; anything else is ignored.
    const std::time_t seconds = timegm(&utc);
    return R::Ok(std::chrono::system_clock::from_time_t(seconds) + fraction);
}

} // namespace mcp_chat
