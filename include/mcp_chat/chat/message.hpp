#pragma once

#include <mcp_chat/core/result.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcp_chat {

enum class Role {
    System,
    User,
    Assistant,
    Tool,
};

const char* RoleName(Role role);
std::optional<Role> ParseRole(const std::string& name);

// ---------------------------------------------------------------------------
// ToolCallRequest — one function call requested by the model, resolved to a
// server and tool.
//
// `function_name` is the name exactly as the model produced it. When it
// could not be resolved, `server_name` is empty and `tool_name` holds the
// raw name; invocation then fails and the failure goes back to the model.
// ---------------------------------------------------------------------------
struct ToolCallRequest {
    std::string id;
    std::string server_name;
    std::string tool_name;
    nlohmann::json arguments = nlohmann::json::object();
    std::string function_name;

    [[nodiscard]] bool IsResolved() const { return !server_name.empty(); }

    /// "server__tool", or the raw function name when unresolved.
    [[nodiscard]] std::string FullName() const;
};

// ---------------------------------------------------------------------------
// ConversationMessage — one entry of the conversation history.
// ---------------------------------------------------------------------------
struct ConversationMessage {
    Role role = Role::User;
    std::optional<std::string> content;
    std::vector<ToolCallRequest> tool_calls;    // assistant only
    std::optional<std::string> tool_call_id;    // tool only
    std::optional<std::string> name;            // tool only: server__tool
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();

    static ConversationMessage System(std::string text);
    static ConversationMessage User(std::string text);
    static ConversationMessage Assistant(std::optional<std::string> text,
                                         std::vector<ToolCallRequest> calls = {});
    static ConversationMessage Tool(std::string call_id, std::string full_name,
                                    std::string payload);

    /// Chat-completions wire shape: role always; content only when set;
    /// tool_calls with JSON-string arguments; tool_call_id and name only
    /// when set.
    [[nodiscard]] nlohmann::json ToModelFormat() const;

    /// Persistence shape, including the timestamp and resolved tool calls.
    [[nodiscard]] nlohmann::json ToJson() const;
    [[nodiscard]] static Result<ConversationMessage, Error> FromJson(
        const nlohmann::json& j);
};

/// ISO-8601 UTC with milliseconds, e.g. "2024-05-01T09:30:00.250Z".
std::string FormatTimestamp(std::chrono::system_clock::time_point tp);

/// Accepts "YYYY-MM-DDTHH:MM:SS", optional fractional seconds, optional "Z".
Result<std::chrono::system_clock::time_point, Error> ParseTimestamp(
    const std::string& text);

} // namespace mcp_chat
