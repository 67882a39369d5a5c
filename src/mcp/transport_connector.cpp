#include <mcp_chat/mcp/transport_connector.hpp>

#include <mcp_chat/core/log.hpp>
#include <mcp_chat/mcp/mcp_session.hpp>
#include <mcp_chat/mcp/sse_transport.hpp>
#include <mcp_chat/mcp/stdio_transport.hpp>
#include <mcp_chat/mcp/streamable_http_transport.hpp>

namespace mcp_chat {

namespace {

// Upcast Result<unique_ptr<Derived>> to Result<unique_ptr<ITransport>>.
template <typename T>
Result<std::unique_ptr<ITransport>, Error> AsTransport(
    Result<std::unique_ptr<T>, Error> result) {
    if (result.IsErr()) {
        return Result<std::unique_ptr<ITransport>, Error>::Err(
            std::move(result).Error());
    }
    return Result<std::unique_ptr<ITransport>, Error>::Ok(
        std::unique_ptr<ITransport>(std::move(result).Value()));
}

std::string Describe(const ServerDescriptor& d) {
    if (d.transport == TransportKind::Stdio) {
        std::string cmd = d.command;
        for (const auto& a : d.args) cmd += " " + a;
        return cmd;
    }
    return d.url;
}

} // anonymous namespace

TransportConnector::TransportConnector(ConnectorOptions options,
                                       TransportFactory factory)
    : options_(options),
      factory_(factory ? std::move(factory) : TransportFactory(&OpenTransport)) {}

Result<std::unique_ptr<ITransport>, Error> TransportConnector::OpenTransport(
    const ServerDescriptor& descriptor) {
    switch (descriptor.transport) {
        case TransportKind::Stdio:
            return AsTransport(StdioTransport::Spawn(descriptor));
        case TransportKind::Sse:
            return AsTransport(SseTransport::Connect(descriptor));
        case TransportKind::StreamableHttp:
            return AsTransport(StreamableHttpTransport::Open(descriptor));
    }
    return Result<std::unique_ptr<ITransport>, Error>::Err(Error{
        "OpenTransport", descriptor.name, std::nullopt, "Unknown transport kind",
        std::nullopt, ErrorCategory::Configuration});
}

Result<std::unique_ptr<Connection>, Error> TransportConnector::Connect(
    const ServerDescriptor& descriptor) {
    using R = Result<std::unique_ptr<Connection>, Error>;

    auto valid = descriptor.Validate();
    if (valid.IsErr()) {
        return R::Err(valid.Error());
    }

    LogInfo("connector", "Connecting to '" + descriptor.name + "' via " +
                             TransportKindName(descriptor.transport) + " (" +
                             Describe(descriptor) + ")");

    auto transport = factory_(descriptor);
    if (transport.IsErr()) {
        auto error = std::move(transport).Error();
        if (error.target.empty()) error.target = descriptor.name;
        return R::Err(std::move(error));
    }

    // From here the session owns the transport; destroying it on any early
    // return closes the transport (child reaped, sockets shut).
    auto session = std::make_unique<McpSession>(descriptor.name,
                                                std::move(transport).Value());

    auto caps = session->Initialize(options_.handshake_timeout);
    if (caps.IsErr()) {
        session->Close();
        auto error = std::move(caps).Error();
        error.message = "Handshake failed: " + error.message;
        return R::Err(std::move(error));
    }

    auto tools = session->ListTools(options_.handshake_timeout);
    if (tools.IsErr()) {
        session->Close();
        auto error = std::move(tools).Error();
        error.message = "Tool listing failed: " + error.message;
        return R::Err(std::move(error));
    }

    const auto tool_count = tools.Value().size();
    auto connection = std::make_unique<Connection>(
        descriptor.name, std::move(session), std::move(tools).Value(),
        std::move(caps).Value());

    LogInfo("connector", "Connected to '" + descriptor.name + "' (" +
                             std::to_string(tool_count) + " tools)");
    return R::Ok(std::move(connection));
}

} // namespace mcp_chat
