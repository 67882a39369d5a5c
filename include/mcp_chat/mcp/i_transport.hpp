#pragma once

#include <mcp_chat/core/result.hpp>
#include <mcp_chat/mcp/server_descriptor.hpp>

#include <chrono>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace mcp_chat {

// ---------------------------------------------------------------------------
// ITransport — abstract JSON-RPC 2.0 channel to one remote tool server.
//
// McpSession speaks the MCP client protocol over this interface, so the
// protocol layer is tested offline via MockTransport.
//
// Request() blocks the calling thread until the matching response arrives,
// the timeout elapses (ErrorCategory::Timeout) or the channel closes
// (ErrorCategory::Closed). Concurrent Request() calls from several threads
// are allowed. Close() is idempotent and releases the child process,
// sockets and reader threads before returning.
// ---------------------------------------------------------------------------
class ITransport {
public:
    virtual ~ITransport() = default;

    // Non-copyable, non-movable (polymorphic base).
    ITransport(const ITransport&) = delete;
    ITransport& operator=(const ITransport&) = delete;
    ITransport(ITransport&&) = delete;
    ITransport& operator=(ITransport&&) = delete;

    /// Send a request and wait for its "result". A JSON-RPC "error" member
    /// comes back as an Err with ErrorCategory::Protocol.
    [[nodiscard]] virtual Result<nlohmann::json, Error> Request(
        const std::string& method,
        const nlohmann::json& params,
        std::optional<std::chrono::milliseconds> timeout) = 0;

    /// Send a notification (no id, no response).
    [[nodiscard]] virtual Result<void, Error> Notify(
        const std::string& method,
        const nlohmann::json& params) = 0;

    virtual void Close() = 0;

    [[nodiscard]] virtual bool IsOpen() const = 0;
    [[nodiscard]] virtual TransportKind Kind() const = 0;

protected:
    ITransport() = default;
};

} // namespace mcp_chat
