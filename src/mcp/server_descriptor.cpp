#include <mcp_chat/mcp/server_descriptor.hpp>

#include <mcp_chat/core/url.hpp>

namespace mcp_chat {

namespace {

constexpr std::chrono::milliseconds kSseConnectTimeout{5'000};
constexpr std::chrono::milliseconds kHttpConnectTimeout{30'000};
constexpr std::chrono::milliseconds kReadTimeout{300'000};

Error MakeDescriptorError(const std::string& name, const std::string& message) {
    return Error{"ValidateDescriptor", name, std::nullopt, message,
                 std::nullopt, ErrorCategory::Configuration};
}

} // anonymous namespace

std::string TransportKindName(TransportKind kind) {
    switch (kind) {
        case TransportKind::Stdio:          return "stdio";
        case TransportKind::Sse:            return "sse";
        case TransportKind::StreamableHttp: return "streamable_http";
    }
    return "unknown";
}

std::optional<TransportKind> ParseTransportKind(const std::string& text) {
    if (text == "stdio") return TransportKind::Stdio;
    if (text == "sse") return TransportKind::Sse;
    if (text == "streamable_http" || text == "streamable-http" || text == "http") {
        return TransportKind::StreamableHttp;
    }
    return std::nullopt;
}

std::chrono::milliseconds ServerDescriptor::EffectiveTimeout() const {
    if (timeout.has_value()) return *timeout;
    return transport == TransportKind::Sse ? kSseConnectTimeout
                                           : kHttpConnectTimeout;
}

std::chrono::milliseconds ServerDescriptor::EffectiveReadTimeout() const {
    return sse_read_timeout.value_or(kReadTimeout);
}

Result<void, Error> ServerDescriptor::Validate() const {
    if (name.empty()) {
        return Result<void, Error>::Err(
            MakeDescriptorError(name, "Server name must not be empty"));
    }
    if (name.find(kToolNameSeparator) != std::string::npos) {
        return Result<void, Error>::Err(MakeDescriptorError(
            name, "Server name '" + name + "' must not contain '" +
                      kToolNameSeparator + "'"));
    }

    switch (transport) {
        case TransportKind::Stdio:
            if (command.empty() || args.empty()) {
                return Result<void, Error>::Err(MakeDescriptorError(
                    name, "stdio transport requires 'command' and 'args'"));
            }
            break;
        case TransportKind::Sse:
        case TransportKind::StreamableHttp: {
            if (url.empty()) {
                return Result<void, Error>::Err(MakeDescriptorError(
                    name, TransportKindName(transport) + " transport requires 'url'"));
            }
            auto parsed = ParseUrl(url);
            if (parsed.IsErr()) {
                return Result<void, Error>::Err(
                    MakeDescriptorError(name, parsed.Error().message));
            }
            if ((timeout.has_value() && timeout->count() <= 0) ||
                (sse_read_timeout.has_value() && sse_read_timeout->count() <= 0)) {
                return Result<void, Error>::Err(
                    MakeDescriptorError(name, "Timeouts must be positive"));
            }
            break;
        }
    }
    return Result<void, Error>::Ok();
}

ServerDescriptor ServerDescriptor::Stdio(std::string name, std::string command,
                                         std::vector<std::string> args) {
    ServerDescriptor d;
    d.name = std::move(name);
    d.transport = TransportKind::Stdio;
    d.command = std::move(command);
    d.args = std::move(args);
    return d;
}

ServerDescriptor ServerDescriptor::Sse(std::string name, std::string url) {
    ServerDescriptor d;
    d.name = std::move(name);
    d.transport = TransportKind::Sse;
    d.url = std::move(url);
    return d;
}

ServerDescriptor ServerDescriptor::StreamableHttp(std::string name,
                                                  std::string url) {
    ServerDescriptor d;
    d.name = std::move(name);
    d.transport = TransportKind::StreamableHttp;
    d.url = std::move(url);
    return d;
}

} // namespace mcp_chat
