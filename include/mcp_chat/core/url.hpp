#pragma once

#include <mcp_chat/core/result.hpp>

#include <string>

namespace mcp_chat {

// ---------------------------------------------------------------------------
// Url — an absolute http(s) URL split the way httplib::Client wants it:
// an origin for the client constructor and a path (with query) per request.
// ---------------------------------------------------------------------------
struct Url {
    std::string scheme;  // "http" or "https"
    std::string host;
    int port = 0;
    std::string path;    // always starts with '/', includes any query string

    /// "scheme://host[:port]"; the port is omitted when it is the default.
    [[nodiscard]] std::string Origin() const;
    [[nodiscard]] std::string ToString() const { return Origin() + path; }
    [[nodiscard]] bool IsHttps() const { return scheme == "https"; }
};

/// Parse an absolute http:// or https:// URL. Fragments are dropped.
Result<Url, Error> ParseUrl(const std::string& url);

/// Resolve a reference (absolute URL, "//host/x", "/abs/path", "rel/path"
/// or "?query") against a base URL.
std::string ResolveReference(const Url& base, const std::string& reference);

} // namespace mcp_chat
