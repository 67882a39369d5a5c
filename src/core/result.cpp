#include <mcp_chat/core/result.hpp>

#include <nlohmann/json.hpp>

#include <sstream>

namespace mcp_chat {

namespace {

// Pull a human-readable message out of a JSON error body. Providers use
// several shapes:
//   {"error": {"message": "..."}}   OpenAI / OpenRouter, JSON-RPC envelopes
//   {"error": "..."}
//   {"message": "..."} / {"detail": "..."}
std::optional<std::string> ExtractBodyMessage(const std::string& body) {
    if (body.empty()) return std::nullopt;

    auto parsed = nlohmann::json::parse(body, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) return std::nullopt;

    if (parsed.contains("error")) {
        const auto& err = parsed["error"];
        if (err.is_string()) return err.get<std::string>();
        if (err.is_object() && err.contains("message") &&
            err["message"].is_string()) {
            return err["message"].get<std::string>();
        }
    }
    for (const char* key : {"message", "detail"}) {
        if (parsed.contains(key) && parsed[key].is_string()) {
            return parsed[key].get<std::string>();
        }
    }
    return std::nullopt;
}

} // anonymous namespace

Error Error::FromHttpStatus(const std::string& operation,
                            const std::string& target,
                            int status_code,
                            const std::string& response_body) {
    auto detail = ExtractBodyMessage(response_body);

    ErrorCategory category;
    std::string message;

    switch (status_code) {
        case 400:
            category = ErrorCategory::Protocol;
            message = "Bad request";
            break;
        case 401:
            category = ErrorCategory::Authentication;
            message = "Authentication failed - check the API key or server headers";
            break;
        case 403:
            category = ErrorCategory::Authentication;
            message = "Forbidden";
            break;
        case 404:
            category = ErrorCategory::NotFound;
            message = "Not found";
            break;
        case 408:
            category = ErrorCategory::Timeout;
            message = "Request timed out";
            break;
        case 429:
            category = ErrorCategory::Timeout;
            message = "Too many requests - retry later";
            break;
        case 500:
            category = ErrorCategory::Internal;
            message = "Server internal error";
            break;
        case 502:
        case 503:
        case 504:
            category = ErrorCategory::Connection;
            message = "Server unavailable";
            break;
        default:
            category = ErrorCategory::Internal;
            message = "Unexpected HTTP " + std::to_string(status_code);
            break;
    }
    if (detail.has_value()) {
        message += ": " + *detail;
    }

    return Error{operation, target, status_code, message, detail, category};
}

int Error::ExitCode() const {
    switch (category) {
        case ErrorCategory::Configuration:  return 2;
        case ErrorCategory::Connection:     return 3;
        case ErrorCategory::Authentication: return 3;
        case ErrorCategory::NotFound:       return 4;
        case ErrorCategory::DuplicateName:  return 4;
        case ErrorCategory::Closed:         return 5;
        case ErrorCategory::Timeout:        return 6;
        case ErrorCategory::ToolInvocation: return 7;
        case ErrorCategory::Protocol:       return 8;
        case ErrorCategory::Model:          return 9;
        case ErrorCategory::Storage:        return 10;
        case ErrorCategory::Internal:       return 99;
    }
    return 99;
}

std::string Error::CategoryName() const {
    switch (category) {
        case ErrorCategory::Configuration:  return "configuration";
        case ErrorCategory::Connection:     return "connection";
        case ErrorCategory::Authentication: return "authentication";
        case ErrorCategory::NotFound:       return "not_found";
        case ErrorCategory::DuplicateName:  return "duplicate_name";
        case ErrorCategory::Closed:         return "closed";
        case ErrorCategory::Timeout:        return "timeout";
        case ErrorCategory::ToolInvocation: return "tool_invocation";
        case ErrorCategory::Protocol:       return "protocol";
        case ErrorCategory::Model:          return "model";
        case ErrorCategory::Storage:        return "storage";
        case ErrorCategory::Internal:       return "internal";
    }
    return "internal";
}

std::string Error::ToString() const {
    std::ostringstream oss;
    oss << operation;
    if (!target.empty()) {
        oss << " [" << target << "]";
    }
    if (http_status.has_value()) {
        oss << " (HTTP " << *http_status << ")";
    }
    oss << ": " << message;
    if (cause.has_value() && !cause->empty() &&
        message.find(*cause) == std::string::npos) {
        oss << " (cause: " << *cause << ")";
    }
    return oss.str();
}

std::string Error::ToJson() const {
    nlohmann::json body = {
        {"category", CategoryName()},
        {"operation", operation},
        {"message", message},
        {"exit_code", ExitCode()},
    };
    if (!target.empty()) {
        body["target"] = target;
    }
    if (http_status.has_value()) {
        body["http_status"] = *http_status;
    }
    if (cause.has_value() && !cause->empty()) {
        body["cause"] = *cause;
    }
    return nlohmann::json{{"error", body}}.dump(
        -1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace mcp_chat
