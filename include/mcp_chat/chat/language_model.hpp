#pragma once

#include <mcp_chat/chat/message.hpp>
#include <mcp_chat/core/result.hpp>

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcp_chat {

// One complete function call as returned by the model.
struct ModelToolCall {
    std::string id;
    std::string name;
    std::string arguments;   // JSON text, possibly malformed
};

struct ModelReply {
    std::optional<std::string> content;
    std::vector<ModelToolCall> tool_calls;
    std::string finish_reason;
};

// Piece of a streamed tool call. Pieces with the same index belong to the
// same call; name and arguments arrive in fragments.
struct ToolCallFragment {
    int index = 0;
    std::string id;
    std::string name;
    std::string arguments;
};

struct ModelDelta {
    std::string content;
    std::vector<ToolCallFragment> tool_calls;
};

// ---------------------------------------------------------------------------
// ILanguageModel — abstract chat-completion endpoint.
//
// ConversationEngine depends on this interface so it can be tested with
// MockLanguageModel. `tools` is a function-call schema list; an empty list
// means no tools are offered.
// ---------------------------------------------------------------------------
class ILanguageModel {
public:
    /// Return false to stop the stream early.
    using DeltaCallback = std::function<bool(const ModelDelta&)>;

    virtual ~ILanguageModel() = default;

    // Non-copyable, non-movable (polymorphic base).
    ILanguageModel(const ILanguageModel&) = delete;
    ILanguageModel& operator=(const ILanguageModel&) = delete;
    ILanguageModel(ILanguageModel&&) = delete;
    ILanguageModel& operator=(ILanguageModel&&) = delete;

    [[nodiscard]] virtual Result<ModelReply, Error> Complete(
        const std::vector<ConversationMessage>& messages,
        const nlohmann::json& tools) = 0;

    /// Stream one reply. Returns Ok once the stream has ended, or after the
    /// callback asked to stop.
    [[nodiscard]] virtual Result<void, Error> Stream(
        const std::vector<ConversationMessage>& messages,
        const nlohmann::json& tools,
        const DeltaCallback& on_delta) = 0;

    [[nodiscard]] virtual std::string ModelName() const = 0;

protected:
    ILanguageModel() = default;
};

} // namespace mcp_chat
