#pragma once

#include <mcp_chat/chat/language_model.hpp>
#include <mcp_chat/chat/message.hpp>
#include <mcp_chat/chat/tool_catalog.hpp>
#include <mcp_chat/chat/tool_invoker.hpp>
#include <mcp_chat/core/result.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcp_chat {

class SessionRegistry;

constexpr const char* kDefaultSystemPrompt =
    "You are a helpful assistant with access to various tools. "
    "Use the available tools when needed to answer user questions accurately.";
constexpr const char* kNoResponseFallback =
    "I apologize, but I couldn't generate a response.";
constexpr const char* kIterationCapFallback =
    "I apologize, but I couldn't complete the task within the allowed steps.";

struct EngineOptions {
    /// Added as the first message of an empty history. Empty disables it.
    std::string system_prompt = kDefaultSystemPrompt;
    int max_iterations = 10;
    std::optional<std::chrono::milliseconds> tool_timeout = std::chrono::seconds(30);
};

// ---------------------------------------------------------------------------
// Streaming events
// ---------------------------------------------------------------------------
struct TokenEvent {
    std::string text;
};

struct ToolCallStartedEvent {
    std::string id;
    std::string server_name;
    std::string tool_name;
    nlohmann::json arguments;
};

struct ToolCallResultEvent {
    std::string id;
    std::string server_name;
    std::string tool_name;
    bool success = false;
    std::string result;     // serialized payload, or the error text
};

struct DoneEvent {
    std::string content;
};

using ChatEvent =
    std::variant<TokenEvent, ToolCallStartedEvent, ToolCallResultEvent, DoneEvent>;

struct TurnStats {
    int iterations = 0;
    int tool_calls = 0;
    bool hit_iteration_cap = false;
};

// ---------------------------------------------------------------------------
// ChatEventStream — pull side of one streamed turn.
//
// The turn starts on the first Next() and runs on a producer thread that
// blocks while the buffer is full. Next() returns events in order, then
// Ok(std::nullopt) once the turn is over; a failed turn yields its error
// once after the events that preceded it. Destroying the stream early
// cancels the turn and waits for the producer to stop.
// ---------------------------------------------------------------------------
class ChatEventStream {
public:
    ~ChatEventStream();
    ChatEventStream(ChatEventStream&&) noexcept;
    ChatEventStream& operator=(ChatEventStream&&) noexcept;

    ChatEventStream(const ChatEventStream&) = delete;
    ChatEventStream& operator=(const ChatEventStream&) = delete;

    [[nodiscard]] Result<std::optional<ChatEvent>, Error> Next();

private:
    friend class ConversationEngine;
    struct State;
    explicit ChatEventStream(std::unique_ptr<State> state);
    void Stop();

    std::unique_ptr<State> state_;
};

// ---------------------------------------------------------------------------
// ConversationEngine — runs the model/tool loop over one conversation.
//
// Each turn appends the user message, then alternates model calls and tool
// execution until the model answers without tool calls or max_iterations
// model calls have been made. The tool schema is rebuilt from the registry
// before every model call. Tool failures are folded into the history as
// tool messages; model failures end the turn with an error. History is
// append-only within a turn. Not safe for concurrent use.
// ---------------------------------------------------------------------------
class ConversationEngine {
public:
    /// Return false to cancel the turn.
    using EventCallback = std::function<bool(const ChatEvent&)>;

    ConversationEngine(ILanguageModel& model,
                       SessionRegistry& registry,
                       EngineOptions options = {},
                       std::vector<ConversationMessage> history = {});

    ConversationEngine(const ConversationEngine&) = delete;
    ConversationEngine& operator=(const ConversationEngine&) = delete;

    /// Blocking turn. Returns the final assistant text.
    [[nodiscard]] Result<std::string, Error> Send(const std::string& user_text);

    /// Streamed turn delivered through `on_event`. Returns the text of the
    /// Done event.
    [[nodiscard]] Result<std::string, Error> SendStreaming(const std::string& user_text,
                                                           const EventCallback& on_event);

    /// Streamed turn as a pull-based event sequence. The engine must outlive
    /// the stream.
    [[nodiscard]] ChatEventStream SendStreaming(const std::string& user_text);

    [[nodiscard]] const std::vector<ConversationMessage>& History() const {
        return history_;
    }

    /// Drop all messages, keeping only the configured system prompt.
    void ClearHistory();
    void AddSystemMessage(const std::string& text);

    /// Messages appended since the previous call.
    [[nodiscard]] std::vector<ConversationMessage> TakeUnpersisted();

    [[nodiscard]] TurnStats LastTurnStats() const { return stats_; }
    [[nodiscard]] const EngineOptions& Options() const { return options_; }

private:
    void Append(ConversationMessage message);
    std::vector<ToolCallRequest> ResolveCalls(const std::vector<ModelToolCall>& calls,
                                              const ToolCatalog& catalog);

    ILanguageModel& model_;
    SessionRegistry& registry_;
    ToolInvoker invoker_;
    EngineOptions options_;
    std::vector<ConversationMessage> history_;
    std::size_t persisted_ = 0;
    TurnStats stats_;
};

} // namespace mcp_chat
