#pragma once

#include <mcp_chat/core/result.hpp>
#include <mcp_chat/mcp/i_transport.hpp>
#include <mcp_chat/mcp/server_descriptor.hpp>

#include <memory>
#include <string>

namespace mcp_chat {

// ---------------------------------------------------------------------------
// StreamableHttpTransport — the MCP "streamable HTTP" transport.
//
// Every client message is one POST to the server URL. The server answers
// either with an application/json body or with a text/event-stream that
// carries the response (plus any server requests and notifications) as
// "message" events. The Mcp-Session-Id header returned during the
// handshake is sent with every later request; Close() ends the session
// with an HTTP DELETE.
//
// Each request uses its own connection, so concurrent requests never share
// a socket. The read timeout of a request is the smaller of its call
// timeout and `sse_read_timeout`.
// ---------------------------------------------------------------------------
class StreamableHttpTransport : public ITransport {
public:
    static Result<std::unique_ptr<StreamableHttpTransport>, Error> Open(
        const ServerDescriptor& descriptor);

    ~StreamableHttpTransport() override;

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
        return TransportKind::StreamableHttp;
    }

    /// Session id assigned by the server (empty until the handshake).
    [[nodiscard]] std::string SessionId() const;

private:
    struct Impl;
    explicit StreamableHttpTransport(std::unique_ptr<Impl> impl);

    std::unique_ptr<Impl> impl_;
};

} // namespace mcp_chat
