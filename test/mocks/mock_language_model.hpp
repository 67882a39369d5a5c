#pragma once

#include <mcp_chat/chat/language_model.hpp>

#include <deque>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcp_chat {
namespace testing {

// ---------------------------------------------------------------------------
// MockLanguageModel — scripted ILanguageModel.
//
// Usage:
//   MockLanguageModel model;
//   model.EnqueueReply(MockLanguageModel::ToolCallReply("c1", "srv__echo", R"({"x":1})"));
//   model.EnqueueReply(MockLanguageModel::TextReply("done"));
//   ConversationEngine engine(model, registry);
//   engine.Send("hi");
//   CHECK(model.Calls().size() == 2);
//
// Complete() consumes replies and Stream() consumes scripted streams, FIFO.
// An empty queue yields a Model error. Every call records the history and
// the tool schema it was given.
// ---------------------------------------------------------------------------

struct ModelCall {
    std::vector<ConversationMessage> messages;
    nlohmann::json tools;
    bool streamed = false;
};

struct ScriptedStream {
    std::vector<ModelDelta> deltas;
    std::optional<Error> error;    // returned after the deltas, if set
};

class MockLanguageModel : public ILanguageModel {
public:
    // -- Builders -----------------------------------------------------------

    static Result<ModelReply, Error> TextReply(const std::string& text) {
        ModelReply reply;
        reply.content = text;
        reply.finish_reason = "stop";
        return Result<ModelReply, Error>::Ok(std::move(reply));
    }

    static Result<ModelReply, Error> ToolCallReply(const std::string& id,
                                                   const std::string& name,
                                                   const std::string& arguments) {
        ModelReply reply;
        reply.tool_calls.push_back(ModelToolCall{id, name, arguments});
        reply.finish_reason = "tool_calls";
        return Result<ModelReply, Error>::Ok(std::move(reply));
    }

    static Result<ModelReply, Error> Failure(const std::string& message,
                                             std::optional<int> http_status = std::nullopt) {
        return Result<ModelReply, Error>::Err(
            Error{"Complete", "mock-model", http_status, message, std::nullopt,
                  ErrorCategory::Model});
    }

    static ModelDelta Token(const std::string& text) {
        ModelDelta delta;
        delta.content = text;
        return delta;
    }

    static ModelDelta Fragment(int index, const std::string& id, const std::string& name,
                               const std::string& arguments) {
        ModelDelta delta;
        delta.tool_calls.push_back(ToolCallFragment{index, id, name, arguments});
        return delta;
    }

    // -- Scripting ----------------------------------------------------------

    void EnqueueReply(Result<ModelReply, Error> reply) {
        replies_.push_back(std::move(reply));
    }

    void EnqueueStream(ScriptedStream stream) {
        streams_.push_back(std::move(stream));
    }

    // -- ILanguageModel -----------------------------------------------------

    Result<ModelReply, Error> Complete(const std::vector<ConversationMessage>& messages,
                                       const nlohmann::json& tools) override {
        calls_.push_back(ModelCall{messages, tools, false});
        if (replies_.empty()) {
            return Failure("MockLanguageModel: no reply queued");
        }
        auto reply = std::move(replies_.front());
        replies_.pop_front();
        return reply;
    }

    Result<void, Error> Stream(const std::vector<ConversationMessage>& messages,
                               const nlohmann::json& tools,
                               const DeltaCallback& on_delta) override {
        calls_.push_back(ModelCall{messages, tools, true});
        if (streams_.empty()) {
            return Result<void, Error>::Err(
                Error{"Stream", "mock-model", std::nullopt,
                      "MockLanguageModel: no stream queued", std::nullopt,
                      ErrorCategory::Model});
        }
        auto stream = std::move(streams_.front());
        streams_.pop_front();
        for (const auto& delta : stream.deltas) {
            ++deltas_delivered_;
            if (!on_delta(delta)) {
                ++streams_stopped_;
                return Result<void, Error>::Ok();
            }
        }
        if (stream.error.has_value()) {
            return Result<void, Error>::Err(*stream.error);
        }
        return Result<void, Error>::Ok();
    }

    std::string ModelName() const override { return "mock-model"; }

    // -- Inspection ---------------------------------------------------------

    const std::vector<ModelCall>& Calls() const { return calls_; }
    int DeltasDelivered() const { return deltas_delivered_; }
    int StreamsStopped() const { return streams_stopped_; }

private:
    std::deque<Result<ModelReply, Error>> replies_;
    std::deque<ScriptedStream> streams_;
    std::vector<ModelCall> calls_;
    int deltas_delivered_ = 0;
    int streams_stopped_ = 0;
};

} // namespace testing
} // namespace mcp_chat
