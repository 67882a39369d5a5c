#pragma once

#include <mcp_chat/chat/message.hpp>
#include <mcp_chat/mcp/tool_types.hpp>

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace mcp_chat {

class SessionRegistry;

// ---------------------------------------------------------------------------
// ToolCallOutcome — result of one tool call as the model will see it.
// Exactly one of payload / error is set.
// ---------------------------------------------------------------------------
struct ToolCallOutcome {
    std::string id;
    std::string server_name;
    std::string tool_name;
    std::string full_name;
    bool success = false;
    std::optional<std::string> payload;
    std::optional<std::string> error;
};

// ---------------------------------------------------------------------------
// ToolInvoker — executes model tool calls against the registry.
//
// Execute never fails: registry errors and exceptions become failure
// outcomes, so one broken tool cannot abort the conversation turn.
// ---------------------------------------------------------------------------
class ToolInvoker {
public:
    using OutcomeCallback = std::function<void(const ToolCallOutcome&)>;

    explicit ToolInvoker(SessionRegistry& registry,
                         std::optional<std::chrono::milliseconds> timeout =
                             std::chrono::seconds(30));

    [[nodiscard]] ToolCallOutcome Execute(const ToolCallRequest& request) const;

    /// Run all requests concurrently and return outcomes in request order.
    /// `on_outcome`, if set, sees each outcome in request order as soon as it
    /// and all earlier ones are available.
    std::vector<ToolCallOutcome> ExecuteAll(const std::vector<ToolCallRequest>& requests,
                                            const OutcomeCallback& on_outcome = nullptr) const;

    /// Canonical text payload for a tool result.
    [[nodiscard]] static std::string Serialize(const ToolResult& result);

    /// Tool message that answers `outcome.id`.
    [[nodiscard]] static ConversationMessage ToToolMessage(const ToolCallOutcome& outcome);

private:
    SessionRegistry& registry_;
    std::optional<std::chrono::milliseconds> timeout_;
};

} // namespace mcp_chat
