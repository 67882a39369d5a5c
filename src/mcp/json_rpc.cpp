#include <mcp_chat/mcp/json_rpc.hpp>

namespace mcp_chat {

namespace jsonrpc {

nlohmann::json MakeRequest(std::int64_t id, const std::string& method,
                           const nlohmann::json& params) {
    nlohmann::json msg = {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"method", method},
    };
    if (!params.is_null()) {
        msg["params"] = params;
    }
    return msg;
}

nlohmann::json MakeNotification(const std::string& method,
                                const nlohmann::json& params) {
    nlohmann::json msg = {
        {"jsonrpc", "2.0"},
        {"method", method},
    };
    if (!params.is_null()) {
        msg["params"] = params;
    }
    return msg;
}

nlohmann::json MakeResult(const nlohmann::json& id, const nlohmann::json& result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result}
    };
}

nlohmann::json MakeError(const nlohmann::json& id, int code,
                         const std::string& message) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {
            {"code", code},
            {"message", message}
        }}
    };
}

MessageKind Classify(const nlohmann::json& message) {
    if (!message.is_object()) return MessageKind::Invalid;
    const bool has_id = message.contains("id") && !message["id"].is_null();
    const bool has_method = message.contains("method") && message["method"].is_string();
    if (has_method) {
        return has_id ? MessageKind::Request : MessageKind::Notification;
    }
    if (has_id && (message.contains("result") || message.contains("error"))) {
        return MessageKind::Response;
    }
    return MessageKind::Invalid;
}

Result<nlohmann::json, Error> ExtractResult(const nlohmann::json& response,
                                            const std::string& operation,
                                            const std::string& target) {
    if (response.contains("error") && !response["error"].is_null()) {
        const auto& err = response["error"];
        int code = 0;
        std::string message = "Unknown JSON-RPC error";
        if (err.is_object()) {
            if (err.contains("code") && err["code"].is_number_integer()) {
                code = err["code"].get<int>();
            }
            if (err.contains("message") && err["message"].is_string()) {
                message = err["message"].get<std::string>();
            }
        }
        return Result<nlohmann::json, Error>::Err(Error{
            operation, target, std::nullopt,
            "JSON-RPC error " + std::to_string(code) + ": " + message,
            std::nullopt, ErrorCategory::Protocol});
    }
    if (!response.contains("result")) {
        return Result<nlohmann::json, Error>::Err(Error{
            operation, target, std::nullopt,
            "Response has neither 'result' nor 'error'",
            std::nullopt, ErrorCategory::Protocol});
    }
    return Result<nlohmann::json, Error>::Ok(response["result"]);
}

nlohmann::json AnswerServerRequest(const nlohmann::json& request) {
    const auto id = request.value("id", nlohmann::json());
    const auto method = request.value("method", "");
    if (method == "ping") {
        return MakeResult(id, nlohmann::json::object());
    }
    return MakeError(id, kMethodNotFound, "Method not found: " + method);
}

} // namespace jsonrpc

// ---------------------------------------------------------------------------
// PendingRequests
// ---------------------------------------------------------------------------
PendingRequests::PendingRequests(std::string target)
    : target_(std::move(target)) {}

PendingRequests::Ticket PendingRequests::Register() {
    std::lock_guard<std::mutex> lock(mutex_);
    Ticket ticket;
    ticket.id = next_id_++;
    std::promise<Outcome> promise;
    ticket.future = promise.get_future();
    if (closed_error_.has_value()) {
        promise.set_value(Outcome::Err(*closed_error_));
    } else {
        waiters_.emplace(ticket.id, std::move(promise));
    }
    return ticket;
}

bool PendingRequests::Resolve(std::int64_t id, Outcome outcome) {
    std::promise<Outcome> promise;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = waiters_.find(id);
        if (it == waiters_.end()) return false;
        promise = std::move(it->second);
        waiters_.erase(it);
    }
    promise.set_value(std::move(outcome));
    return true;
}

bool PendingRequests::ResolveResponse(const nlohmann::json& response) {
    const auto& id = response["id"];
    std::int64_t numeric_id = 0;
    if (id.is_number_integer()) {
        numeric_id = id.get<std::int64_t>();
    } else if (id.is_string()) {
        // Some servers echo ids back as strings.
        try {
            numeric_id = std::stoll(id.get<std::string>());
        } catch (const std::exception&) {
            return false;
        }
    } else {
        return false;
    }
    return Resolve(numeric_id, jsonrpc::ExtractResult(response, "JsonRpcRequest", target_));
}

void PendingRequests::Cancel(std::int64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    waiters_.erase(id);
}

void PendingRequests::FailAll(const Error& error) {
    std::map<std::int64_t, std::promise<Outcome>> waiters;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!closed_error_.has_value()) {
            closed_error_ = error;
        }
        waiters.swap(waiters_);
    }
    for (auto& [id, promise] : waiters) {
        promise.set_value(Outcome::Err(error));
    }
}

PendingRequests::Outcome PendingRequests::Await(
    Ticket& ticket, const std::string& method,
    std::optional<std::chrono::milliseconds> timeout) {
    if (timeout.has_value()) {
        if (ticket.future.wait_for(*timeout) != std::future_status::ready) {
            Cancel(ticket.id);
            // The response may have raced in between wait_for and Cancel.
            if (ticket.future.wait_for(std::chrono::seconds(0)) ==
                std::future_status::ready) {
                return ticket.future.get();
            }
            return Outcome::Err(Error{
                method, target_, std::nullopt,
                "No response within " + std::to_string(timeout->count()) + " ms",
                std::nullopt, ErrorCategory::Timeout});
        }
    }
    return ticket.future.get();
}

std::size_t PendingRequests::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return waiters_.size();
}

} // namespace mcp_chat
