#pragma once

#include <mcp_chat/core/result.hpp>
#include <mcp_chat/mcp/i_transport.hpp>
#include <mcp_chat/mcp/server_descriptor.hpp>

#include <memory>

namespace mcp_chat {

// ---------------------------------------------------------------------------
// SseTransport — the legacy MCP "HTTP with SSE" transport.
//
// A GET on the descriptor URL opens a text/event-stream. The server's first
// "endpoint" event names the URL that accepts client messages (resolved
// against the stream URL). Requests are POSTed there; responses come back
// as "message" events on the stream, in any order.
//
// The stream is owned by a background thread. `timeout` bounds connecting
// and waiting for the endpoint; `sse_read_timeout` bounds silence on the
// stream.
// ---------------------------------------------------------------------------
class SseTransport : public ITransport {
public:
    static Result<std::unique_ptr<SseTransport>, Error> Connect(
        const ServerDescriptor& descriptor);

    ~SseTransport() override;

    [[nodiscard]] Result<nlohmann::json, Error> Request(
        const std::string& method,
        const nlohmann::json& params,
        std::optional<std::chrono::milliseconds> timeout) override;

    [[nodiscard]] Result<void, Error> Notify(
        const std::string& method,
        const nlohmann::json& params) override;

    void Close() override;

    [[nodiscard]] bool IsOpen() const override;
    [[nodiscard]] TransportKind Kind() const override {
        return TransportKind::Sse;
    }

    /// Absolute URL the server told us to post messages to.
    [[nodiscard]] std::string MessageEndpoint() const;

private:
    struct Impl;
    explicit SseTransport(std::unique_ptr<Impl> impl);

    std::unique_ptr<Impl> impl_;
};

} // namespace mcp_chat
