#include <mcp_chat/chat/openai_model.hpp>

#include "core/http_utils.hpp"
#include <mcp_chat/core/log.hpp>
#include <mcp_chat/core/sse_parser.hpp>

#include <httplib.h>

namespace mcp_chat {

namespace {

constexpr const char* kCompletionsPath = "/chat/completions";
constexpr const char* kDoneMarker = "[DONE]";

Error MakeModelError(const std::string& operation, const std::string& target,
                     const std::string& message,
                     std::optional<int> http_status = std::nullopt) {
    return Error{operation, target, http_status, message, std::nullopt,
                 ErrorCategory::Model};
}

// Keep the HTTP-derived message and status, but report as a model failure.
Error ModelErrorFromStatus(const std::string& operation, const std::string& target,
                           int status, const std::string& body) {
    auto error = Error::FromHttpStatus(operation, target, status, body);
    error.cause = error.CategoryName();
    error.category = ErrorCategory::Model;
    return error;
}

std::string Dump(const nlohmann::json& j) {
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string ProviderMessage(const nlohmann::json& error) {
    if (error.is_object() && error.contains("message") && error["message"].is_string()) {
        return error["message"].get<std::string>();
    }
    if (error.is_string()) return error.get<std::string>();
    return Dump(error);
}

std::string JoinEndpoint(const Url& base) {
    auto path = base.path;
    while (!path.empty() && path.back() == '/') path.pop_back();
    return path + kCompletionsPath;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Parsing
// ---------------------------------------------------------------------------
Result<ModelReply, Error> ParseCompletion(const nlohmann::json& body) {
    using R = Result<ModelReply, Error>;
    if (body.is_object() && body.contains("error")) {
        return R::Err(MakeModelError("Complete", "", ProviderMessage(body["error"])));
    }
    if (!body.is_object() || !body.contains("choices") || !body["choices"].is_array() ||
        body["choices"].empty()) {
        return R::Err(MakeModelError("Complete", "", "Response has no choices"));
    }
    const auto& choice = body["choices"][0];
    if (!choice.contains("message") || !choice["message"].is_object()) {
        return R::Err(MakeModelError("Complete", "", "Choice has no message"));
    }
    const auto& message = choice["message"];

    ModelReply reply;
    if (message.contains("content") && message["content"].is_string()) {
        reply.content = message["content"].get<std::string>();
    }
    if (message.contains("tool_calls") && message["tool_calls"].is_array()) {
        for (const auto& tc : message["tool_calls"]) {
            ModelToolCall call;
            call.id = tc.value("id", "");
            if (tc.contains("function") && tc["function"].is_object()) {
                const auto& fn = tc["function"];
                call.name = fn.value("name", "");
                if (fn.contains("arguments")) {
                    call.arguments = fn["arguments"].is_string()
                                         ? fn["arguments"].get<std::string>()
                                         : Dump(fn["arguments"]);
                }
            }
            reply.tool_calls.push_back(std::move(call));
        }
    }
    if (choice.contains("finish_reason") && choice["finish_reason"].is_string()) {
        reply.finish_reason = choice["finish_reason"].get<std::string>();
    }
    return R::Ok(std::move(reply));
}

ModelDelta ParseStreamChunk(const nlohmann::json& chunk) {
    ModelDelta delta;
    if (!chunk.is_object() || !chunk.contains("choices") || !chunk["choices"].is_array() ||
        chunk["choices"].empty()) {
        return delta;
    }
    const auto& choice = chunk["choices"][0];
    if (!choice.contains("delta") || !choice["delta"].is_object()) {
        return delta;
    }
    const auto& d = choice["delta"];
    if (d.contains("content") && d["content"].is_string()) {
        delta.content = d["content"].get<std::string>();
    }
    if (d.contains("tool_calls") && d["tool_calls"].is_array()) {
        for (const auto& tc : d["tool_calls"]) {
            ToolCallFragment fragment;
            if (tc.contains("index") && tc["index"].is_number_integer()) {
                fragment.index = tc["index"].get<int>();
            }
            if (tc.contains("id") && tc["id"].is_string()) {
                fragment.id = tc["id"].get<std::string>();
            }
            if (tc.contains("function") && tc["function"].is_object()) {
                const auto& fn = tc["function"];
                if (fn.contains("name") && fn["name"].is_string()) {
                    fragment.name = fn["name"].get<std::string>();
                }
                if (fn.contains("arguments") && fn["arguments"].is_string()) {
                    fragment.arguments = fn["arguments"].get<std::string>();
                }
            }
            delta.tool_calls.push_back(std::move(fragment));
        }
    }
    return delta;
}

// ---------------------------------------------------------------------------
// OpenAiChatModel
// ---------------------------------------------------------------------------
OpenAiChatModel::OpenAiChatModel(OpenAiModelOptions options, Url endpoint)
    : options_(std::move(options)), endpoint_(std::move(endpoint)) {}

Result<std::unique_ptr<OpenAiChatModel>, Error> OpenAiChatModel::Create(
    OpenAiModelOptions options) {
    using R = Result<std::unique_ptr<OpenAiChatModel>, Error>;
    auto base = ParseUrl(options.base_url);
    if (base.IsErr()) {
        auto error = std::move(base).Error();
        error.operation = "CreateModel";
        return R::Err(std::move(error));
    }
    if (options.api_key.empty()) {
        return R::Err(Error{"CreateModel", options.base_url, std::nullopt,
                            "No API key configured for the model endpoint",
                            std::nullopt, ErrorCategory::Configuration});
    }
    Url endpoint = base.Value();
    endpoint.path = JoinEndpoint(base.Value());
    return R::Ok(std::unique_ptr<OpenAiChatModel>(
        new OpenAiChatModel(std::move(options), std::move(endpoint))));
}

nlohmann::json OpenAiChatModel::BuildRequestBody(
    const std::vector<ConversationMessage>& messages,
    const nlohmann::json& tools,
    bool stream) const {
    auto wire = nlohmann::json::array();
    for (const auto& m : messages) {
        wire.push_back(m.ToModelFormat());
    }
    nlohmann::json body = {
        {"model", options_.model},
        {"messages", std::move(wire)},
        {"temperature", options_.temperature},
    };
    if (tools.is_array() && !tools.empty()) {
        body["tools"] = tools;
    }
    if (stream) {
        body["stream"] = true;
    }
    return body;
}

Result<ModelReply, Error> OpenAiChatModel::Complete(
    const std::vector<ConversationMessage>& messages,
    const nlohmann::json& tools) {
    using R = Result<ModelReply, Error>;
    const auto target = endpoint_.ToString();

    auto made = http_utils::MakeClient(endpoint_, options_.connect_timeout,
                                       options_.read_timeout);
    if (made.IsErr()) {
        return R::Err(made.Error());
    }
    auto client = std::move(made).Value();

    httplib::Headers headers = http_utils::ToHttplibHeaders(options_.extra_headers);
    headers.emplace("Authorization", "Bearer " + options_.api_key);
    headers.emplace("Accept", "application/json");

    const auto body = Dump(BuildRequestBody(messages, tools, false));
    LogDebug("model", "POST " + target + " (" + std::to_string(messages.size()) +
                          " messages, " + std::to_string(tools.size()) + " tools)");
    http_utils::LogRequestHeaders("model", headers);

    auto res = client->Post(endpoint_.path, headers, body, "application/json");
    if (!res) {
        auto http_error = res.error();
        return R::Err(MakeModelError("Complete", target,
                                     "Request failed: " + httplib::to_string(http_error)));
    }
    LogDebug("model", "HTTP " + std::to_string(res->status) + " " +
                          http_utils::BodyForLog(res->body));
    if (res->status < 200 || res->status >= 300) {
        return R::Err(ModelErrorFromStatus("Complete", target, res->status, res->body));
    }

    auto parsed = nlohmann::json::parse(res->body, nullptr, false);
    if (parsed.is_discarded()) {
        return R::Err(MakeModelError("Complete", target, "Response is not valid JSON",
                                     res->status));
    }
    auto reply = ParseCompletion(parsed);
    if (reply.IsErr()) {
        auto error = std::move(reply).Error();
        error.target = target;
        error.http_status = res->status;
        return R::Err(std::move(error));
    }
    return reply;
}

Result<void, Error> OpenAiChatModel::Stream(
    const std::vector<ConversationMessage>& messages,
    const nlohmann::json& tools,
    const DeltaCallback& on_delta) {
    using R = Result<void, Error>;
    const auto target = endpoint_.ToString();

    auto made = http_utils::MakeClient(endpoint_, options_.connect_timeout,
                                       options_.read_timeout);
    if (made.IsErr()) {
        return R::Err(made.Error());
    }
    auto client = std::move(made).Value();

    httplib::Request req;
    req.method = "POST";
    req.path = endpoint_.path;
    req.headers = http_utils::ToHttplibHeaders(options_.extra_headers);
    req.headers.emplace("Authorization", "Bearer " + options_.api_key);
    req.headers.emplace("Accept", "text/event-stream");
    req.headers.emplace("Content-Type", "application/json");
    req.body = Dump(BuildRequestBody(messages, tools, true));

    int status = 0;
    std::string error_body;
    SseParser parser;
    bool finished = false;
    bool stopped = false;
    std::optional<Error> stream_error;

    req.response_handler = [&](const httplib::Response& response) {
        status = response.status;
        return true;
    };
    req.content_receiver = [&](const char* data, size_t length,
                               uint64_t /*offset*/, uint64_t /*total*/) {
        if (status < 200 || status >= 300) {
            error_body.append(data, length);
            return true;
        }
        for (const auto& ev : parser.Feed(std::string_view(data, length))) {
            if (ev.data == kDoneMarker) {
                finished = true;
                return false;
            }
            auto chunk = nlohmann::json::parse(ev.data, nullptr, false);
            if (chunk.is_discarded()) {
                LogDebug("model", "Ignoring non-JSON chunk: " + ev.data);
                continue;
            }
            if (chunk.is_object() && chunk.contains("error")) {
                stream_error = MakeModelError("Stream", target,
                                              ProviderMessage(chunk["error"]), status);
                return false;
            }
            auto delta = ParseStreamChunk(chunk);
            if (delta.content.empty() && delta.tool_calls.empty()) {
                continue;
            }
            if (!on_delta(delta)) {
                stopped = true;
                return false;
            }
        }
        return true;
    };

    LogDebug("model", "POST " + target + " (stream, " +
                          std::to_string(messages.size()) + " messages)");
    http_utils::LogRequestHeaders("model", req.headers);

    httplib::Response res;
    httplib::Error http_error = httplib::Error::Success;
    const bool sent = client->send(req, res, http_error);

    if (stream_error.has_value()) {
        return R::Err(std::move(*stream_error));
    }
    if (status != 0 && (status < 200 || status >= 300)) {
        LogDebug("model", "HTTP " + std::to_string(status) + " " +
                              http_utils::BodyForLog(error_body));
        return R::Err(ModelErrorFromStatus("Stream", target, status, error_body));
    }
    if (finished || stopped) {
        return R::Ok();
    }
    if (!sent) {
        return R::Err(MakeModelError("Stream", target,
                                     "Request failed: " + httplib::to_string(http_error),
                                     status == 0 ? std::nullopt : std::optional<int>(status)));
    }
    // Stream closed without [DONE]; treat what arrived as the full reply.
    LogDebug("model", "Stream ended without [DONE]");
    return R::Ok();
}

} // namespace mcp_chat
