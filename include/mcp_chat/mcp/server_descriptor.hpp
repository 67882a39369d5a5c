#pragma once

#include <mcp_chat/core/result.hpp>

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace mcp_chat {

enum class TransportKind {
    Stdio,
    Sse,
    StreamableHttp,
};

/// "stdio", "sse" or "streamable_http".
std::string TransportKindName(TransportKind kind);

/// Accepts the canonical names plus "http" and "streamable-http".
std::optional<TransportKind> ParseTransportKind(const std::string& text);

// ---------------------------------------------------------------------------
// ServerDescriptor — everything needed to reach one remote tool server.
//
// Which fields matter depends on `transport`: command/args/env/cwd for a
// subprocess, url/headers/timeouts for the HTTP-based kinds. Unset timeouts
// take the per-kind defaults (EffectiveTimeout / EffectiveReadTimeout).
// ---------------------------------------------------------------------------
struct ServerDescriptor {
    std::string name;
    TransportKind transport = TransportKind::Stdio;

    // stdio
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    std::optional<std::string> cwd;

    // sse / streamable_http
    std::string url;
    std::map<std::string, std::string> headers;
    std::optional<std::chrono::milliseconds> timeout;
    std::optional<std::chrono::milliseconds> sse_read_timeout;

    [[nodiscard]] std::chrono::milliseconds EffectiveTimeout() const;
    [[nodiscard]] std::chrono::milliseconds EffectiveReadTimeout() const;

    /// Checks the parameters required by the declared transport. Fails with
    /// ErrorCategory::Configuration; never touches the network or spawns.
    [[nodiscard]] Result<void, Error> Validate() const;

    static ServerDescriptor Stdio(std::string name, std::string command,
                                  std::vector<std::string> args = {});
    static ServerDescriptor Sse(std::string name, std::string url);
    static ServerDescriptor StreamableHttp(std::string name, std::string url);
};

/// Separator between server and tool in a catalog name ("weather__forecast").
constexpr const char* kToolNameSeparator = "__";

} // namespace mcp_chat
