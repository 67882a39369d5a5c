#include <mcp_chat/mcp/streamable_http_transport.hpp>

#include "core/http_utils.hpp"
#include <mcp_chat/core/log.hpp>
#include <mcp_chat/core/sse_parser.hpp>
#include <mcp_chat/core/url.hpp>
#include <mcp_chat/mcp/json_rpc.hpp>

#include <httplib.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <set>

namespace mcp_chat {

namespace {

constexpr const char* kSessionHeader = "Mcp-Session-Id";

Error MakeHttpError(const std::string& operation, const std::string& target,
                    const std::string& message,
                    ErrorCategory category = ErrorCategory::Connection,
                    std::optional<int> http_status = std::nullopt) {
    return Error{operation, target, http_status, message, std::nullopt, category};
}

std::string Dump(const nlohmann::json& j) {
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------
struct StreamableHttpTransport::Impl {
    std::string name;
    Url url;
    httplib::Headers headers;
    std::chrono::milliseconds connect_timeout;
    std::chrono::milliseconds read_timeout;

    std::atomic<std::int64_t> next_id{1};
    std::atomic<bool> open{true};

    mutable std::mutex mutex;
    std::string session_id;                 // guarded by mutex
    std::set<httplib::Client*> in_flight;   // guarded by mutex
    bool closed = false;                    // guarded by mutex

    Impl(std::string server_name, Url target)
        : name(std::move(server_name)), url(std::move(target)) {}

    httplib::Headers RequestHeaders() const {
        auto hdrs = headers;
        hdrs.emplace("Accept", "application/json, text/event-stream");
        std::lock_guard<std::mutex> lock(mutex);
        if (!session_id.empty()) {
            hdrs.emplace(kSessionHeader, session_id);
        }
        return hdrs;
    }

    void CaptureSessionId(const httplib::Headers& response_headers) {
        auto value = http_utils::FindHeaderCi(response_headers, kSessionHeader);
        if (!value.has_value() || value->empty()) return;
        std::lock_guard<std::mutex> lock(mutex);
        if (session_id != *value) {
            session_id = *value;
            LogDebug("http", name + ": session " + session_id);
        }
    }

    // Register a client so Close() can interrupt it.
    bool Track(httplib::Client* client) {
        std::lock_guard<std::mutex> lock(mutex);
        if (closed) return false;
        in_flight.insert(client);
        return true;
    }

    void Untrack(httplib::Client* client) {
        std::lock_guard<std::mutex> lock(mutex);
        in_flight.erase(client);
    }

    // Route one message that arrived on a response body. Returns true when
    // it is the response to `want_id`.
    bool Dispatch(const nlohmann::json& message,
                  const std::optional<std::int64_t>& want_id,
                  std::optional<nlohmann::json>& matched) {
        switch (jsonrpc::Classify(message)) {
            case jsonrpc::MessageKind::Response: {
                const auto& id = message["id"];
                if (want_id.has_value() && id.is_number_integer() &&
                    id.get<std::int64_t>() == *want_id) {
                    matched = message;
                    return true;
                }
                LogDebug("http", name + ": response for unexpected id " + id.dump());
                return false;
            }
            case jsonrpc::MessageKind::Request: {
                auto posted = Send("AnswerServerRequest",
                                   jsonrpc::AnswerServerRequest(message),
                                   std::nullopt, connect_timeout);
                if (posted.IsErr()) {
                    LogWarn("http", posted.Error().ToString());
                }
                return false;
            }
            case jsonrpc::MessageKind::Notification:
                LogDebug("http", name + ": notification " +
                                     message["method"].get<std::string>());
                return false;
            case jsonrpc::MessageKind::Invalid:
                LogDebug("http", name + ": ignoring invalid message " + Dump(message));
                return false;
        }
        return false;
    }

    // POST one message. For requests (`want_id` set) returns the matching
    // response envelope; for notifications and answers returns null.
    // `read` bounds each socket read; `deadline` bounds the whole exchange,
    // including event streams that keep sending other messages.
    Result<nlohmann::json, Error> Send(
        const std::string& operation,
        const nlohmann::json& message,
        std::optional<std::int64_t> want_id,
        std::chrono::milliseconds read,
        std::optional<std::chrono::steady_clock::time_point> deadline = std::nullopt) {
        using R = Result<nlohmann::json, Error>;

        auto made = http_utils::MakeClient(url, connect_timeout, read);
        if (made.IsErr()) {
            return R::Err(made.Error());
        }
        auto client = std::move(made).Value();
        if (!Track(client.get())) {
            return R::Err(MakeHttpError(operation, name, "Transport is closed",
                                        ErrorCategory::Closed));
        }

        httplib::Request req;
        req.method = "POST";
        req.path = url.path;
        req.headers = RequestHeaders();
        req.headers.emplace("Content-Type", "application/json");
        req.body = Dump(message);

        int status = 0;
        bool event_stream = false;
        std::string body;
        SseParser parser;
        std::optional<nlohmann::json> matched;
        bool expired = false;
        auto past_deadline = [&] {
            if (deadline.has_value() && std::chrono::steady_clock::now() >= *deadline) {
                expired = true;
            }
            return expired;
        };

        req.response_handler = [&](const httplib::Response& response) {
            if (past_deadline()) return false;
            status = response.status;
            event_stream = http_utils::IsEventStream(response.headers);
            CaptureSessionId(response.headers);
            return true;
        };
        req.content_receiver = [&](const char* data, size_t length,
                                   uint64_t /*offset*/, uint64_t /*total*/) {
            if (past_deadline()) return false;
            if (!event_stream || status < 200 || status >= 300) {
                body.append(data, length);
                return true;
            }
            for (const auto& ev : parser.Feed(std::string_view(data, length))) {
                if (ev.event != "message") continue;
                auto parsed = nlohmann::json::parse(ev.data, nullptr, false);
                if (parsed.is_discarded()) {
                    LogDebug("http", name + ": ignoring non-JSON event: " + ev.data);
                    continue;
                }
                if (Dispatch(parsed, want_id, matched)) {
                    return false;  // got our response; stop reading
                }
            }
            return !past_deadline();
        };

        LogDebug("http", "POST " + url.ToString() + " " + operation);
        http_utils::LogRequestHeaders("http", req.headers);

        httplib::Response res;
        httplib::Error http_error = httplib::Error::Success;
        const bool sent = client->send(req, res, http_error);
        Untrack(client.get());

        if (matched.has_value()) {
            return R::Ok(std::move(*matched));
        }
        if (expired) {
            LogDebug("http", name + ": " + operation + " passed its deadline");
            return R::Err(MakeHttpError(operation, name, "No response before the deadline",
                                        ErrorCategory::Timeout));
        }
        if (!sent && status == 0) {
            if (!open.load()) {
                return R::Err(MakeHttpError(operation, name, "Transport is closed",
                                            ErrorCategory::Closed));
            }
            return R::Err(MakeHttpError(
                operation, url.ToString(),
                "HTTP request failed: " + httplib::to_string(http_error),
                http_utils::CategoryFromHttpTransportError(http_error)));
        }
        if (status == 404 && !SessionId().empty()) {
            return R::Err(MakeHttpError(operation, name,
                                        "Server session expired", ErrorCategory::Connection,
                                        status));
        }
        if (status < 200 || status >= 300) {
            LogDebug("http", "  < body: " + http_utils::BodyForLog(body));
            return R::Err(Error::FromHttpStatus(operation, url.ToString(), status, body));
        }
        if (!want_id.has_value()) {
            return R::Ok(nlohmann::json());
        }
        if (!sent) {
            return R::Err(MakeHttpError(
                operation, url.ToString(),
                "Response stream interrupted: " + httplib::to_string(http_error),
                http_utils::CategoryFromHttpTransportError(http_error)));
        }
        if (event_stream) {
            return R::Err(MakeHttpError(operation, name,
                                        "Event stream ended without a response",
                                        ErrorCategory::Protocol));
        }

        auto parsed = nlohmann::json::parse(body, nullptr, false);
        if (parsed.is_discarded()) {
            return R::Err(MakeHttpError(operation, name,
                                        "Response body is not JSON",
                                        ErrorCategory::Protocol));
        }
        // The body may be a single envelope or a batch.
        if (parsed.is_array()) {
            for (const auto& item : parsed) {
                if (Dispatch(item, want_id, matched)) break;
            }
        } else {
            Dispatch(parsed, want_id, matched);
        }
        if (matched.has_value()) {
            return R::Ok(std::move(*matched));
        }
        return R::Err(MakeHttpError(operation, name,
                                    "Response does not answer request " +
                                        std::to_string(*want_id),
                                    ErrorCategory::Protocol));
    }

    std::string SessionId() const {
        std::lock_guard<std::mutex> lock(mutex);
        return session_id;
    }
};

// ---------------------------------------------------------------------------
// Open
// ---------------------------------------------------------------------------
Result<std::unique_ptr<StreamableHttpTransport>, Error> StreamableHttpTransport::Open(
    const ServerDescriptor& descriptor) {
    using R = Result<std::unique_ptr<StreamableHttpTransport>, Error>;

    auto url = ParseUrl(descriptor.url);
    if (url.IsErr()) {
        return R::Err(url.Error());
    }

    auto impl = std::make_unique<Impl>(descriptor.name, url.Value());
    impl->headers = http_utils::ToHttplibHeaders(descriptor.headers);
    impl->connect_timeout = descriptor.EffectiveTimeout();
    impl->read_timeout = descriptor.EffectiveReadTimeout();

    // Fail early on unusable URLs (e.g. https without TLS support).
    auto probe = http_utils::MakeClient(impl->url, impl->connect_timeout,
                                        impl->read_timeout);
    if (probe.IsErr()) {
        return R::Err(probe.Error());
    }
    return R::Ok(std::unique_ptr<StreamableHttpTransport>(
        new StreamableHttpTransport(std::move(impl))));
}

StreamableHttpTransport::StreamableHttpTransport(std::unique_ptr<Impl> impl)
    : impl_(std::move(impl)) {}

StreamableHttpTransport::~StreamableHttpTransport() {
    Close();
}

Result<nlohmann::json, Error> StreamableHttpTransport::Request(
    const std::string& method,
    const nlohmann::json& params,
    std::optional<std::chrono::milliseconds> timeout) {
    using R = Result<nlohmann::json, Error>;
    if (!impl_->open.load()) {
        return R::Err(MakeHttpError(method, impl_->name, "Transport is closed",
                                    ErrorCategory::Closed));
    }

    const auto id = impl_->next_id.fetch_add(1);
    std::optional<std::chrono::steady_clock::time_point> deadline;
    auto read = impl_->read_timeout;
    if (timeout.has_value()) {
        deadline = std::chrono::steady_clock::now() + *timeout;
        read = std::min(*timeout, impl_->read_timeout);
    }
    auto response = impl_->Send(method, jsonrpc::MakeRequest(id, method, params),
                                id, read, deadline);
    if (response.IsErr()) {
        auto error = std::move(response).Error();
        if (error.category == ErrorCategory::Timeout && timeout.has_value() &&
            (*timeout <= impl_->read_timeout ||
             std::chrono::steady_clock::now() >= *deadline)) {
            error.message = "No response within " +
                            std::to_string(timeout->count()) + " ms";
        }
        return R::Err(std::move(error));
    }
    return jsonrpc::ExtractResult(response.Value(), method, impl_->name);
}

Result<void, Error> StreamableHttpTransport::Notify(const std::string& method,
                                                    const nlohmann::json& params) {
    if (!impl_->open.load()) {
        return Result<void, Error>::Err(MakeHttpError(
            method, impl_->name, "Transport is closed", ErrorCategory::Closed));
    }
    auto sent = impl_->Send(method, jsonrpc::MakeNotification(method, params),
                            std::nullopt, impl_->connect_timeout);
    if (sent.IsErr()) {
        return Result<void, Error>::Err(sent.Error());
    }
    return Result<void, Error>::Ok();
}

void StreamableHttpTransport::Close() {
    std::string session;
    {
        // Clients are only destroyed after Untrack(), so stopping them under
        // the lock is safe.
        std::lock_guard<std::mutex> lock(impl_->mutex);
        if (impl_->closed) return;
        impl_->closed = true;
        impl_->open.store(false);
        for (auto* client : impl_->in_flight) {
            client->stop();
        }
        session = impl_->session_id;
    }

    if (!session.empty()) {
        auto made = http_utils::MakeClient(impl_->url, impl_->connect_timeout,
                                           impl_->connect_timeout);
        if (made.IsOk()) {
            auto hdrs = impl_->headers;
            hdrs.emplace(kSessionHeader, session);
            auto res = made.Value()->Delete(impl_->url.path, hdrs);
            if (!res) {
                LogDebug("http", impl_->name + ": session DELETE failed: " +
                                     httplib::to_string(res.error()));
            } else if (res->status >= 400 && res->status != 405) {
                LogDebug("http", impl_->name + ": session DELETE returned " +
                                     std::to_string(res->status));
            }
        }
    }
    LogDebug("http", impl_->name + ": closed");
}

bool StreamableHttpTransport::IsOpen() const {
    return impl_->open.load();
}

std::string StreamableHttpTransport::SessionId() const {
    return impl_->SessionId();
}

} // namespace mcp_chat
