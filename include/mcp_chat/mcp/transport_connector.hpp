#pragma once

#include <mcp_chat/core/result.hpp>
#include <mcp_chat/mcp/connection.hpp>
#include <mcp_chat/mcp/i_transport.hpp>
#include <mcp_chat/mcp/server_descriptor.hpp>

#include <chrono>
#include <functional>
#include <memory>

namespace mcp_chat {

// ---------------------------------------------------------------------------
// IConnector — turns a descriptor into a live Connection.
//
// One call is one attempt: no retries here. On failure every resource
// acquired by the attempt has been released before the error is returned.
// SessionRegistry depends on this interface so it can be tested with
// MockConnector.
// ---------------------------------------------------------------------------
class IConnector {
public:
    virtual ~IConnector() = default;

    // Non-copyable, non-movable (polymorphic base).
    IConnector(const IConnector&) = delete;
    IConnector& operator=(const IConnector&) = delete;
    IConnector(IConnector&&) = delete;
    IConnector& operator=(IConnector&&) = delete;

    [[nodiscard]] virtual Result<std::unique_ptr<Connection>, Error> Connect(
        const ServerDescriptor& descriptor) = 0;

protected:
    IConnector() = default;
};

struct ConnectorOptions {
    /// Bound on each handshake request (initialize, each tools/list page).
    std::chrono::milliseconds handshake_timeout{30'000};
};

// ---------------------------------------------------------------------------
// TransportConnector — the real connector: validates the descriptor, opens
// the transport for its kind, runs initialize and tools/list.
// ---------------------------------------------------------------------------
class TransportConnector : public IConnector {
public:
    /// Opens a transport for a validated descriptor. Replaceable so the
    /// handshake can be exercised over scripted transports.
    using TransportFactory = std::function<Result<std::unique_ptr<ITransport>, Error>(
        const ServerDescriptor&)>;

    explicit TransportConnector(ConnectorOptions options = {},
                                TransportFactory factory = nullptr);

    [[nodiscard]] Result<std::unique_ptr<Connection>, Error> Connect(
        const ServerDescriptor& descriptor) override;

    /// Default factory: StdioTransport, SseTransport or
    /// StreamableHttpTransport according to descriptor.transport.
    static Result<std::unique_ptr<ITransport>, Error> OpenTransport(
        const ServerDescriptor& descriptor);

private:
    ConnectorOptions options_;
    TransportFactory factory_;
};

} // namespace mcp_chat
