#include <mcp_chat/chat/conversation_engine.hpp>

#include <mcp_chat/chat/tool_call_accumulator.hpp>
#include <mcp_chat/core/log.hpp>
#include <mcp_chat/mcp/session_registry.hpp>

#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>

namespace mcp_chat {

namespace {

constexpr std::size_t kStreamBufferSize = 64;

Error CancelledError() {
    return Error{"SendStreaming", "", std::nullopt, "Turn cancelled by the consumer",
                 std::nullopt, ErrorCategory::Internal};
}

std::optional<std::string> NonEmpty(std::string text) {
    if (text.empty()) return std::nullopt;
    return text;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// ConversationEngine
// ---------------------------------------------------------------------------
ConversationEngine::ConversationEngine(ILanguageModel& model,
                                       SessionRegistry& registry,
                                       EngineOptions options,
                                       std::vector<ConversationMessage> history)
    : model_(model),
      registry_(registry),
      invoker_(registry, options.tool_timeout),
      options_(std::move(options)),
      history_(std::move(history)),
      persisted_(history_.size()) {
    if (history_.empty() && !options_.system_prompt.empty()) {
        history_.push_back(ConversationMessage::System(options_.system_prompt));
    }
}

void ConversationEngine::Append(ConversationMessage message) {
    history_.push_back(std::move(message));
}

std::vector<ToolCallRequest> ConversationEngine::ResolveCalls(
    const std::vector<ModelToolCall>& calls, const ToolCatalog& catalog) {
    std::vector<ToolCallRequest> requests;
    requests.reserve(calls.size());
    for (std::size_t i = 0; i < calls.size(); ++i) {
        const auto& call = calls[i];
        auto id = call.id.empty()
                      ? "call_" + std::to_string(history_.size()) + "_" + std::to_string(i)
                      : call.id;
        requests.push_back(catalog.ResolveFunctionCall(id, call.name, call.arguments));
    }
    return requests;
}

// ---------------------------------------------------------------------------
// Send
// ---------------------------------------------------------------------------
Result<std::string, Error> ConversationEngine::Send(const std::string& user_text) {
    using R = Result<std::string, Error>;
    stats_ = TurnStats{};
    Append(ConversationMessage::User(user_text));

    for (int iteration = 1; iteration <= options_.max_iterations; ++iteration) {
        stats_.iterations = iteration;
        const auto catalog = ToolCatalog::Build(registry_);
        LogDebug("engine", "Iteration " + std::to_string(iteration) + " with " +
                               std::to_string(catalog.Size()) + " tools");

        auto reply = model_.Complete(history_, catalog.ToModelSchema());
        if (reply.IsErr()) {
            LogError("engine", "Model call failed: " + reply.Error().ToString());
            return R::Err(std::move(reply).Error());
        }
        auto value = std::move(reply).Value();
        auto requests = ResolveCalls(value.tool_calls, catalog);

        if (requests.empty()) {
            if (value.content.has_value() && !value.content->empty()) {
                Append(ConversationMessage::Assistant(value.content));
                return R::Ok(*value.content);
            }
            LogWarn("engine", "Model returned neither content nor tool calls");
            return R::Ok(std::string(kNoResponseFallback));
        }

        Append(ConversationMessage::Assistant(NonEmpty(value.content.value_or("")),
                                              requests));
        stats_.tool_calls += static_cast<int>(requests.size());
        LogInfo("engine", "Executing " + std::to_string(requests.size()) + " tool call(s)");
        for (const auto& outcome : invoker_.ExecuteAll(requests)) {
            Append(ToolInvoker::ToToolMessage(outcome));
        }
    }

    stats_.hit_iteration_cap = true;
    LogWarn("engine", "Reached max_iterations (" +
                          std::to_string(options_.max_iterations) + ")");
    return R::Ok(std::string(kIterationCapFallback));
}

// ---------------------------------------------------------------------------
// SendStreaming (callback)
// ---------------------------------------------------------------------------
Result<std::string, Error> ConversationEngine::SendStreaming(const std::string& user_text,
                                                             const EventCallback& on_event) {
    using R = Result<std::string, Error>;
    stats_ = TurnStats{};
    Append(ConversationMessage::User(user_text));

    bool cancelled = false;
    auto emit = [&](const ChatEvent& event) {
        if (!cancelled && !on_event(event)) {
            cancelled = true;
        }
        return !cancelled;
    };

    for (int iteration = 1; iteration <= options_.max_iterations; ++iteration) {
        stats_.iterations = iteration;
        const auto catalog = ToolCatalog::Build(registry_);

        std::string content;
        ToolCallAccumulator accumulator;
        auto streamed = model_.Stream(
            history_, catalog.ToModelSchema(), [&](const ModelDelta& delta) {
                for (const auto& fragment : delta.tool_calls) {
                    accumulator.Add(fragment);
                }
                if (!delta.content.empty()) {
                    content += delta.content;
                    return emit(TokenEvent{delta.content});
                }
                return true;
            });
        if (streamed.IsErr()) {
            LogError("engine", "Model stream failed: " + streamed.Error().ToString());
            return R::Err(std::move(streamed).Error());
        }
        if (cancelled) {
            return R::Err(CancelledError());
        }

        auto requests = ResolveCalls(accumulator.Finish(), catalog);
        if (requests.empty()) {
            if (content.empty()) {
                LogWarn("engine", "Model returned neither content nor tool calls");
                content = kNoResponseFallback;
            } else {
                Append(ConversationMessage::Assistant(content));
            }
            emit(DoneEvent{content});
            return R::Ok(std::move(content));
        }

        Append(ConversationMessage::Assistant(NonEmpty(content), requests));
        stats_.tool_calls += static_cast<int>(requests.size());
        for (const auto& request : requests) {
            emit(ToolCallStartedEvent{request.id, request.server_name, request.tool_name,
                                      request.arguments});
        }

        // Tool messages are appended even after a cancel so the assistant
        // message never lacks its answers.
        invoker_.ExecuteAll(requests, [&](const ToolCallOutcome& outcome) {
            Append(ToolInvoker::ToToolMessage(outcome));
            emit(ToolCallResultEvent{
                outcome.id, outcome.server_name, outcome.tool_name, outcome.success,
                outcome.success ? outcome.payload.value_or("") : outcome.error.value_or("")});
        });
        if (cancelled) {
            return R::Err(CancelledError());
        }
    }

    stats_.hit_iteration_cap = true;
    LogWarn("engine", "Reached max_iterations (" +
                          std::to_string(options_.max_iterations) + ")");
    emit(DoneEvent{kIterationCapFallback});
    return R::Ok(std::string(kIterationCapFallback));
}

// ---------------------------------------------------------------------------
// History
// ---------------------------------------------------------------------------
void ConversationEngine::ClearHistory() {
    history_.clear();
    persisted_ = 0;
    if (!options_.system_prompt.empty()) {
        history_.push_back(ConversationMessage::System(options_.system_prompt));
    }
    LogInfo("engine", "Conversation history cleared");
}

void ConversationEngine::AddSystemMessage(const std::string& text) {
    Append(ConversationMessage::System(text));
    LogInfo("engine", "System message added");
}

std::vector<ConversationMessage> ConversationEngine::TakeUnpersisted() {
    std::vector<ConversationMessage> out(history_.begin() + static_cast<std::ptrdiff_t>(persisted_),
                                         history_.end());
    persisted_ = history_.size();
    return out;
}

// ---------------------------------------------------------------------------
// ChatEventStream
// ---------------------------------------------------------------------------
struct ChatEventStream::State {
    ConversationEngine* engine = nullptr;
    std::string user_text;

    std::mutex mutex;
    std::condition_variable cv;
    std::deque<ChatEvent> queue;
    std::optional<Error> error;
    bool started = false;
    bool finished = false;
    bool cancelled = false;
    bool error_reported = false;
    std::thread producer;

    void Produce() {
        auto result = engine->SendStreaming(user_text, [this](const ChatEvent& event) {
            std::unique_lock<std::mutex> lock(mutex);
            cv.wait(lock, [this] { return queue.size() < kStreamBufferSize || cancelled; });
            if (cancelled) return false;
            queue.push_back(event);
            cv.notify_all();
            return true;
        });
        std::lock_guard<std::mutex> lock(mutex);
        finished = true;
        if (result.IsErr() && !cancelled) {
            error = std::move(result).Error();
        }
        cv.notify_all();
    }
};

ChatEventStream::ChatEventStream(std::unique_ptr<State> state)
    : state_(std::move(state)) {}

ChatEventStream::ChatEventStream(ChatEventStream&&) noexcept = default;

ChatEventStream& ChatEventStream::operator=(ChatEventStream&& other) noexcept {
    if (this != &other) {
        Stop();
        state_ = std::move(other.state_);
    }
    return *this;
}

ChatEventStream::~ChatEventStream() {
    Stop();
}

void ChatEventStream::Stop() {
    if (!state_) return;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->cancelled = true;
    }
    state_->cv.notify_all();
    if (state_->producer.joinable()) {
        state_->producer.join();
    }
}

Result<std::optional<ChatEvent>, Error> ChatEventStream::Next() {
    using R = Result<std::optional<ChatEvent>, Error>;
    if (!state_) {
        return R::Ok(std::nullopt);
    }
    auto& s = *state_;
    std::unique_lock<std::mutex> lock(s.mutex);
    if (!s.started) {
        s.started = true;
        s.producer = std::thread([&s] { s.Produce(); });
    }
    s.cv.wait(lock, [&s] { return !s.queue.empty() || s.finished; });
    if (!s.queue.empty()) {
        std::optional<ChatEvent> event(std::move(s.queue.front()));
        s.queue.pop_front();
        s.cv.notify_all();
        return R::Ok(std::move(event));
    }
    if (s.error.has_value() && !s.error_reported) {
        s.error_reported = true;
        return R::Err(*s.error);
    }
    return R::Ok(std::nullopt);
}

ChatEventStream ConversationEngine::SendStreaming(const std::string& user_text) {
    auto state = std::make_unique<ChatEventStream::State>();
    state->engine = this;
    state->user_text = user_text;
    return ChatEventStream(std::move(state));
}

} // namespace mcp_chat
