#include <mcp_chat/chat/tool_invoker.hpp>

#include <mcp_chat/core/log.hpp>
#include <mcp_chat/mcp/session_registry.hpp>

#include <future>
#include <optional>
#include <system_error>

namespace mcp_chat {

namespace {

std::string Dump(const nlohmann::json& j) {
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

// Strict dump: invalid UTF-8 throws nlohmann::json::type_error.
std::string StrictDump(const nlohmann::json& j) {
    return j.dump();
}

ToolCallOutcome Failure(const ToolCallRequest& request, std::string error) {
    ToolCallOutcome outcome;
    outcome.id = request.id;
    outcome.server_name = request.server_name;
    outcome.tool_name = request.tool_name;
    outcome.full_name = request.FullName();
    outcome.success = false;
    outcome.error = std::move(error);
    return outcome;
}

// A structured result flagged isError, as an error value for the log.
std::optional<Error> RemoteToolError(const ToolCallRequest& request,
                                     const ToolResult& result) {
    const auto* structured = std::get_if<StructuredContent>(&result);
    if (structured == nullptr || !structured->is_error) {
        return std::nullopt;
    }
    Error error;
    error.operation = "CallTool";
    error.target = request.FullName();
    error.message = "Tool reported an error";
    for (const auto& block : structured->blocks) {
        if (const auto* text = std::get_if<TextContent>(&block)) {
            error.message = text->text;
            break;
        }
    }
    error.category = ErrorCategory::ToolInvocation;
    return error;
}

std::string JoinNames(const std::vector<std::string>& names) {
    if (names.empty()) return "(none)";
    std::string out;
    for (const auto& n : names) {
        if (!out.empty()) out += ", ";
        out += n;
    }
    return out;
}

} // anonymous namespace

ToolInvoker::ToolInvoker(SessionRegistry& registry,
                         std::optional<std::chrono::milliseconds> timeout)
    : registry_(registry), timeout_(timeout) {}

// ---------------------------------------------------------------------------
// Execute
// ---------------------------------------------------------------------------
ToolCallOutcome ToolInvoker::Execute(const ToolCallRequest& request) const {
    if (!request.IsResolved()) {
        auto message = "Unknown tool '" + request.FullName() +
                       "'. Available servers: " + JoinNames(registry_.ListServers());
        LogWarn("invoker", message);
        return Failure(request, std::move(message));
    }

    if (GlobalLogger().IsEnabled(LogLevel::Info)) {
        LogInfo("invoker", "Calling " + request.FullName() + " " + Dump(request.arguments));
    }
    try {
        auto result = registry_.Call(request.server_name, request.tool_name,
                                     request.arguments, timeout_);
        if (result.IsErr()) {
            const auto& error = result.Error();
            LogWarn("invoker", request.FullName() + " failed: " + error.ToString());
            return Failure(request, error.message);
        }

        if (auto remote = RemoteToolError(request, result.Value())) {
            LogWarn("invoker", remote->CategoryName() + ": " + remote->ToString());
        }

        ToolCallOutcome outcome;
        outcome.id = request.id;
        outcome.server_name = request.server_name;
        outcome.tool_name = request.tool_name;
        outcome.full_name = request.FullName();
        outcome.success = true;
        outcome.payload = Serialize(result.Value());
        LogDebug("invoker", request.FullName() + " returned " +
                                std::to_string(outcome.payload->size()) + " bytes");
        return outcome;
    } catch (const std::exception& e) {
        LogError("invoker", request.FullName() + " raised: " + e.what());
        return Failure(request, e.what());
    }
}

// ---------------------------------------------------------------------------
// ExecuteAll
// ---------------------------------------------------------------------------
std::vector<ToolCallOutcome> ToolInvoker::ExecuteAll(
    const std::vector<ToolCallRequest>& requests,
    const OutcomeCallback& on_outcome) const {
    std::vector<ToolCallOutcome> outcomes;
    outcomes.reserve(requests.size());

    if (requests.size() == 1) {
        outcomes.push_back(Execute(requests.front()));
        if (on_outcome) on_outcome(outcomes.back());
        return outcomes;
    }

    std::vector<std::future<ToolCallOutcome>> futures;
    futures.reserve(requests.size());
    for (const auto& request : requests) {
        try {
            futures.push_back(std::async(std::launch::async,
                                         [this, &request] { return Execute(request); }));
        } catch (const std::system_error& e) {
            LogWarn("invoker", std::string("Running tool call inline: ") + e.what());
            futures.push_back(std::async(std::launch::deferred,
                                         [this, &request] { return Execute(request); }));
        }
    }
    for (auto& future : futures) {
        outcomes.push_back(future.get());
        if (on_outcome) on_outcome(outcomes.back());
    }
    return outcomes;
}

// ---------------------------------------------------------------------------
// Serialize
// ---------------------------------------------------------------------------
std::string ToolInvoker::Serialize(const ToolResult& result) {
    if (const auto* text = std::get_if<std::string>(&result)) {
        return *text;
    }
    try {
        if (const auto* structured = std::get_if<StructuredContent>(&result)) {
            auto content = nlohmann::json::array();
            for (const auto& block : structured->blocks) {
                content.push_back(ContentBlockToJson(block));
            }
            return StrictDump({{"content", std::move(content)},
                               {"isError", structured->is_error}});
        }
        if (const auto* value = std::get_if<nlohmann::json>(&result)) {
            return StrictDump(*value);
        }
        const auto& opaque = std::get<OpaqueResult>(result);
        return StrictDump({{"result", opaque.text}});
    } catch (const nlohmann::json::exception& e) {
        LogWarn("invoker", std::string("Serialization failed: ") + e.what());
        return Dump({
            {"error", "Serialization failed"},
            {"message", e.what()},
            {"result_type", ToolResultTypeName(result)},
        });
    }
}

ConversationMessage ToolInvoker::ToToolMessage(const ToolCallOutcome& outcome) {
    std::string content;
    if (outcome.success) {
        content = outcome.payload.value_or("");
    } else {
        content = Dump({
            {"error", outcome.error.value_or("")},
            {"message", "Tool " + outcome.tool_name + " failed"},
        });
    }
    return ConversationMessage::Tool(outcome.id, outcome.full_name, std::move(content));
}

} // namespace mcp_chat
