#pragma once

#include <mcp_chat/core/log.hpp>
#include <mcp_chat/core/result.hpp>
#include <mcp_chat/core/url.hpp>

#include <httplib.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace mcp_chat::http_utils {

inline bool IEquals(std::string_view lhs, std::string_view rhs) {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    for (size_t i = 0; i < lhs.size(); ++i) {
        const auto lc = static_cast<unsigned char>(lhs[i]);
        const auto rc = static_cast<unsigned char>(rhs[i]);
        if (std::tolower(lc) != std::tolower(rc)) {
            return false;
        }
    }
    return true;
}

inline std::optional<std::string> FindHeaderCi(const httplib::Headers& headers,
                                               std::string_view key) {
    for (const auto& [k, v] : headers) {
        if (IEquals(k, key)) {
            return v;
        }
    }
    return std::nullopt;
}

inline bool IsEventStream(const httplib::Headers& headers) {
    auto content_type = FindHeaderCi(headers, "Content-Type");
    return content_type.has_value() &&
           content_type->find("text/event-stream") != std::string::npos;
}

inline ErrorCategory CategoryFromHttpTransportError(httplib::Error error) {
    switch (error) {
        case httplib::Error::Timeout:
        case httplib::Error::ConnectionTimeout:
        case httplib::Error::Read:
            return ErrorCategory::Timeout;
        default:
            return ErrorCategory::Connection;
    }
}

inline httplib::Headers ToHttplibHeaders(
    const std::map<std::string, std::string>& headers) {
    httplib::Headers out;
    for (const auto& [key, value] : headers) {
        out.emplace(key, value);
    }
    return out;
}

/// Create a client for `url`'s origin with the given timeouts. Returns an
/// error when the client cannot be used (e.g. https without TLS support).
inline Result<std::unique_ptr<httplib::Client>, Error> MakeClient(
    const Url& url,
    std::chrono::milliseconds connect_timeout,
    std::chrono::milliseconds read_timeout) {
    auto client = std::make_unique<httplib::Client>(url.Origin());
    if (!client->is_valid()) {
        return Result<std::unique_ptr<httplib::Client>, Error>::Err(Error{
            "MakeClient", url.ToString(), std::nullopt,
            url.IsHttps() ? "HTTPS is not available in this build"
                          : "Cannot create HTTP client",
            std::nullopt, ErrorCategory::Configuration});
    }
    client->set_connection_timeout(connect_timeout);
    client->set_read_timeout(read_timeout);
    client->set_write_timeout(connect_timeout);
    client->set_keep_alive(false);
    return Result<std::unique_ptr<httplib::Client>, Error>::Ok(std::move(client));
}

// Log request headers at DEBUG level, redacting credentials.
inline void LogRequestHeaders(std::string_view component,
                              const httplib::Headers& hdrs) {
    for (const auto& [k, v] : hdrs) {
        if (IsSensitiveHeader(k)) {
            LogDebug(component, "  > " + k + ": " + RedactSecret(v));
        } else {
            LogDebug(component, "  > " + k + ": " + v);
        }
    }
}

// Truncate a response body for logging.
inline std::string BodyForLog(const std::string& body) {
    constexpr size_t kMaxBodyLog = 2000;
    if (body.size() <= kMaxBodyLog) {
        return body;
    }
    return body.substr(0, kMaxBodyLog) + "... (truncated)";
}

} // namespace mcp_chat::http_utils
