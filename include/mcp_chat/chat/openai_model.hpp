#pragma once

#include <mcp_chat/chat/language_model.hpp>
#include <mcp_chat/core/result.hpp>
#include <mcp_chat/core/url.hpp>

#include <chrono>
#include <map>
#include <memory>
#include <string>

namespace mcp_chat {

struct OpenAiModelOptions {
    std::string base_url = "https://openrouter.ai/api/v1";
    std::string api_key;
    std::string model = "anthropic/claude-3.5-sonnet";
    double temperature = 0.7;
    std::chrono::milliseconds connect_timeout{30'000};
    std::chrono::milliseconds read_timeout{120'000};
    std::map<std::string, std::string> extra_headers;
};

// ---------------------------------------------------------------------------
// OpenAiChatModel — ILanguageModel over an OpenAI-compatible
// POST {base_url}/chat/completions endpoint, blocking or streamed (SSE,
// terminated by "data: [DONE]"). Every failure is reported with
// ErrorCategory::Model; the HTTP status is kept when there was one.
// ---------------------------------------------------------------------------
class OpenAiChatModel : public ILanguageModel {
public:
    static Result<std::unique_ptr<OpenAiChatModel>, Error> Create(
        OpenAiModelOptions options);

    [[nodiscard]] Result<ModelReply, Error> Complete(
        const std::vector<ConversationMessage>& messages,
        const nlohmann::json& tools) override;

    [[nodiscard]] Result<void, Error> Stream(
        const std::vector<ConversationMessage>& messages,
        const nlohmann::json& tools,
        const DeltaCallback& on_delta) override;

    [[nodiscard]] std::string ModelName() const override { return options_.model; }

    /// Request body for `messages` and `tools`; tools are omitted when empty.
    [[nodiscard]] nlohmann::json BuildRequestBody(
        const std::vector<ConversationMessage>& messages,
        const nlohmann::json& tools,
        bool stream) const;

private:
    OpenAiChatModel(OpenAiModelOptions options, Url endpoint);

    OpenAiModelOptions options_;
    Url endpoint_;
};

/// Parse one non-streamed chat-completions response body.
Result<ModelReply, Error> ParseCompletion(const nlohmann::json& body);

/// Parse one streamed chunk's first choice delta.
ModelDelta ParseStreamChunk(const nlohmann::json& chunk);

} // namespace mcp_chat
