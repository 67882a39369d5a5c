#include <mcp_chat/core/url.hpp>

#include <algorithm>
#include <cctype>

namespace mcp_chat {

namespace {

Error MakeUrlError(const std::string& url, const std::string& message) {
    return Error{"ParseUrl", url, std::nullopt, message, std::nullopt,
                 ErrorCategory::Configuration};
}

int DefaultPort(const std::string& scheme) {
    return scheme == "https" ? 443 : 80;
}

} // anonymous namespace

std::string Url::Origin() const {
    std::string origin = scheme + "://" + host;
    if (port != 0 && port != DefaultPort(scheme)) {
        origin += ":" + std::to_string(port);
    }
    return origin;
}

Result<Url, Error> ParseUrl(const std::string& url) {
    const auto sep = url.find("://");
    if (sep == std::string::npos) {
        return Result<Url, Error>::Err(
            MakeUrlError(url, "URL must start with http:// or https://"));
    }

    Url out;
    out.scheme = url.substr(0, sep);
    std::transform(out.scheme.begin(), out.scheme.end(), out.scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (out.scheme != "http" && out.scheme != "https") {
        return Result<Url, Error>::Err(
            MakeUrlError(url, "Unsupported URL scheme '" + out.scheme + "'"));
    }

    auto rest = url.substr(sep + 3);
    const auto hash = rest.find('#');
    if (hash != std::string::npos) {
        rest.erase(hash);
    }

    const auto path_start = rest.find_first_of("/?");
    auto authority = rest.substr(0, path_start);
    out.path = path_start == std::string::npos ? "/" : rest.substr(path_start);
    if (out.path.front() == '?') {
        out.path.insert(out.path.begin(), '/');
    }

    // Strip userinfo; credentials belong in headers.
    const auto at = authority.rfind('@');
    if (at != std::string::npos) {
        authority.erase(0, at + 1);
    }

    const auto colon = authority.rfind(':');
    if (colon != std::string::npos && authority.find(']') == std::string::npos) {
        const auto port_text = authority.substr(colon + 1);
        if (port_text.empty() ||
            !std::all_of(port_text.begin(), port_text.end(),
                         [](unsigned char c) { return std::isdigit(c) != 0; }) ||
            port_text.size() > 5) {
            return Result<Url, Error>::Err(
                MakeUrlError(url, "Invalid port '" + port_text + "'"));
        }
        out.port = std::stoi(port_text);
        authority.erase(colon);
    } else {
        out.port = DefaultPort(out.scheme);
    }

    if (authority.empty()) {
        return Result<Url, Error>::Err(MakeUrlError(url, "URL has no host"));
    }
    out.host = authority;
    return Result<Url, Error>::Ok(std::move(out));
}

std::string ResolveReference(const Url& base, const std::string& reference) {
    if (reference.rfind("http://", 0) == 0 || reference.rfind("https://", 0) == 0) {
        return reference;
    }
    if (reference.rfind("//", 0) == 0) {
        return base.scheme + ":" + reference;
    }
    if (!reference.empty() && reference.front() == '/') {
        return base.Origin() + reference;
    }

    const auto query = base.path.find('?');
    const auto base_path = base.path.substr(0, query);
    if (!reference.empty() && reference.front() == '?') {
        return base.Origin() + base_path + reference;
    }

    const auto last_slash = base_path.rfind('/');
    const auto dir = base_path.substr(0, last_slash + 1);
    return base.Origin() + dir + reference;
}

} // namespace mcp_chat
