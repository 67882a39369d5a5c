#pragma once

#include <mcp_chat/core/result.hpp>

#include <chrono>
#include <cstdint>
#include <future>
#include <map>
#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace mcp_chat {

constexpr const char* kMcpProtocolVersion = "2024-11-05";

namespace jsonrpc {

constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;

enum class MessageKind {
    Response,       // has "id" and "result" or "error"
    Request,        // has "id" and "method" (server -> client)
    Notification,   // has "method", no "id"
    Invalid,
};

nlohmann::json MakeRequest(std::int64_t id, const std::string& method,
                           const nlohmann::json& params);
nlohmann::json MakeNotification(const std::string& method,
                                const nlohmann::json& params);
nlohmann::json MakeResult(const nlohmann::json& id, const nlohmann::json& result);
nlohmann::json MakeError(const nlohmann::json& id, int code,
                         const std::string& message);

[[nodiscard]] MessageKind Classify(const nlohmann::json& message);

/// Turn a response envelope into the "result" member, or a Protocol error
/// carrying the JSON-RPC error code and message.
Result<nlohmann::json, Error> ExtractResult(const nlohmann::json& response,
                                            const std::string& operation,
                                            const std::string& target);

/// Answer a server-initiated request: "ping" gets an empty result, anything
/// else gets "method not found".
nlohmann::json AnswerServerRequest(const nlohmann::json& request);

} // namespace jsonrpc

// ---------------------------------------------------------------------------
// PendingRequests — correlates JSON-RPC responses with waiting callers.
//
// A transport registers each outgoing request, writes it, and blocks in
// Await(). Its reader thread calls Resolve() as responses arrive, in any
// order. FailAll() wakes every waiter (used when the channel dies) and makes
// later registrations fail immediately, so no caller can hang on a closed
// channel.
// ---------------------------------------------------------------------------
class PendingRequests {
public:
    using Outcome = Result<nlohmann::json, Error>;

    struct Ticket {
        std::int64_t id = 0;
        std::future<Outcome> future;
    };

    explicit PendingRequests(std::string target);

    [[nodiscard]] Ticket Register();

    /// Fulfil one request. Returns false for unknown (e.g. timed out) ids.
    bool Resolve(std::int64_t id, Outcome outcome);

    /// Route a response envelope to its waiter.
    bool ResolveResponse(const nlohmann::json& response);

    /// Drop a request without fulfilling it (caller gave up).
    void Cancel(std::int64_t id);

    /// Fail every waiter with `error` and reject further registrations.
    void FailAll(const Error& error);

    /// Block until the ticket is fulfilled or `timeout` expires.
    Outcome Await(Ticket& ticket, const std::string& method,
                  std::optional<std::chrono::milliseconds> timeout);

    [[nodiscard]] std::size_t Size() const;

private:
    std::string target_;
    mutable std::mutex mutex_;
    std::int64_t next_id_ = 1;
    std::map<std::int64_t, std::promise<Outcome>> waiters_;
    std::optional<Error> closed_error_;
};

} // namespace mcp_chat
