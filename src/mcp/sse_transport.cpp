#include <mcp_chat/mcp/sse_transport.hpp>

#include "core/http_utils.hpp"
#include <mcp_chat/core/log.hpp>
#include <mcp_chat/core/sse_parser.hpp>
#include <mcp_chat/core/url.hpp>
#include <mcp_chat/mcp/json_rpc.hpp>

#include <httplib.h>

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace mcp_chat {

namespace {

constexpr std::chrono::milliseconds kStopPoll{100};

Error MakeSseError(const std::string& operation, const std::string& target,
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
struct SseTransport::Impl {
    std::string name;
    Url stream_url;
    httplib::Headers headers;
    std::chrono::milliseconds connect_timeout;
    std::chrono::milliseconds read_timeout;

    std::unique_ptr<httplib::Client> stream_client;
    PendingRequests pending;
    SseParser parser;

    std::mutex mutex;
    std::condition_variable cv;
    std::optional<Url> endpoint;           // guarded by mutex
    std::optional<Error> stream_error;     // guarded by mutex
    bool reader_done = false;              // guarded by mutex

    std::atomic<bool> open{true};
    std::atomic<bool> closing{false};
    std::mutex close_mutex;
    bool closed = false;
    std::thread reader;

    Impl(std::string server_name, Url url)
        : name(std::move(server_name)), stream_url(std::move(url)), pending(name) {}

    Result<void, Error> Post(const std::string& operation,
                             const nlohmann::json& message,
                             std::chrono::milliseconds read) {
        Url target;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (!endpoint.has_value()) {
                return Result<void, Error>::Err(MakeSseError(
                    operation, name, "No message endpoint announced"));
            }
            target = *endpoint;
        }

        auto client = http_utils::MakeClient(target, connect_timeout, read);
        if (client.IsErr()) {
            return Result<void, Error>::Err(client.Error());
        }
        LogDebug("sse", "POST " + target.ToString() + " " + operation);
        http_utils::LogRequestHeaders("sse", headers);
        auto res = client.Value()->Post(target.path, headers, Dump(message),
                                        "application/json");
        if (!res) {
            const auto http_error = res.error();
            return Result<void, Error>::Err(MakeSseError(
                operation, name,
                "HTTP request failed: " + httplib::to_string(http_error),
                http_utils::CategoryFromHttpTransportError(http_error)));
        }
        if (res->status < 200 || res->status >= 300) {
            LogDebug("sse", "  < body: " + http_utils::BodyForLog(res->body));
            auto error = Error::FromHttpStatus(operation, name, res->status, res->body);
            return Result<void, Error>::Err(std::move(error));
        }
        return Result<void, Error>::Ok();
    }

    void HandleEvent(const SseEvent& ev) {
        if (ev.event == "endpoint") {
            const auto resolved = ResolveReference(stream_url, ev.data);
            auto parsed = ParseUrl(resolved);
            std::lock_guard<std::mutex> lock(mutex);
            if (parsed.IsErr()) {
                stream_error = MakeSseError("SseConnect", name,
                                            "Invalid endpoint '" + ev.data + "'",
                                            ErrorCategory::Protocol);
            } else {
                endpoint = std::move(parsed).Value();
                LogDebug("sse", name + ": message endpoint " + resolved);
            }
            cv.notify_all();
            return;
        }
        if (ev.event != "message") {
            LogDebug("sse", name + ": ignoring event '" + ev.event + "'");
            return;
        }

        auto message = nlohmann::json::parse(ev.data, nullptr, false);
        if (message.is_discarded()) {
            LogDebug("sse", name + ": ignoring non-JSON message: " + ev.data);
            return;
        }
        switch (jsonrpc::Classify(message)) {
            case jsonrpc::MessageKind::Response:
                if (!pending.ResolveResponse(message)) {
                    LogDebug("sse", name + ": response for unknown id " +
                                        message["id"].dump());
                }
                break;
            case jsonrpc::MessageKind::Request: {
                auto posted = Post("AnswerServerRequest",
                                   jsonrpc::AnswerServerRequest(message),
                                   connect_timeout);
                if (posted.IsErr()) {
                    LogWarn("sse", posted.Error().ToString());
                }
                break;
            }
            case jsonrpc::MessageKind::Notification:
                LogDebug("sse", name + ": notification " +
                                    message["method"].get<std::string>());
                break;
            case jsonrpc::MessageKind::Invalid:
                LogDebug("sse", name + ": ignoring invalid message: " + ev.data);
                break;
        }
    }

    void ReaderLoop() {
        auto hdrs = headers;
        hdrs.emplace("Accept", "text/event-stream");
        hdrs.emplace("Cache-Control", "no-cache");

        int status = 0;
        std::string error_body;
        LogDebug("sse", "GET " + stream_url.ToString());
        auto res = stream_client->Get(
            stream_url.path, hdrs,
            [&](const httplib::Response& response) {
                status = response.status;
                return !closing.load();
            },
            [&](const char* data, size_t length) {
                if (status != 200) {
                    error_body.append(data, length);
                    return !closing.load();
                }
                for (const auto& ev : parser.Feed(std::string_view(data, length))) {
                    HandleEvent(ev);
                }
                return !closing.load();
            });

        Error end_error;
        if (closing.load()) {
            end_error = MakeSseError("SseRead", name, "Transport is closed",
                                     ErrorCategory::Closed);
        } else if (!res && status == 0) {
            const auto http_error = res.error();
            end_error = MakeSseError(
                "SseConnect", stream_url.ToString(),
                "HTTP request failed: " + httplib::to_string(http_error),
                http_utils::CategoryFromHttpTransportError(http_error));
        } else if (status != 200) {
            end_error = Error::FromHttpStatus("SseConnect", stream_url.ToString(),
                                              status, error_body);
        } else {
            end_error = MakeSseError("SseRead", name, "Event stream ended");
        }

        open.store(false);
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (!stream_error.has_value()) {
                stream_error = end_error;
            }
            reader_done = true;
        }
        cv.notify_all();
        if (!closing.load()) {
            LogWarn("sse", name + ": " + end_error.message);
        }
        pending.FailAll(end_error);
    }

    // Wait for the endpoint event, a stream failure or the timeout.
    Result<void, Error> AwaitEndpoint() {
        std::unique_lock<std::mutex> lock(mutex);
        const bool signalled = cv.wait_for(lock, connect_timeout, [this] {
            return endpoint.has_value() || stream_error.has_value() || reader_done;
        });
        if (endpoint.has_value()) {
            return Result<void, Error>::Ok();
        }
        if (stream_error.has_value()) {
            return Result<void, Error>::Err(*stream_error);
        }
        return Result<void, Error>::Err(MakeSseError(
            "SseConnect", stream_url.ToString(),
            signalled ? "Event stream ended before the endpoint event"
                      : "No endpoint event within " +
                            std::to_string(connect_timeout.count()) + " ms",
            ErrorCategory::Timeout));
    }
};

// ---------------------------------------------------------------------------
// Connect
// ---------------------------------------------------------------------------
Result<std::unique_ptr<SseTransport>, Error> SseTransport::Connect(
    const ServerDescriptor& descriptor) {
    using R = Result<std::unique_ptr<SseTransport>, Error>;

    auto url = ParseUrl(descriptor.url);
    if (url.IsErr()) {
        return R::Err(url.Error());
    }

    auto impl = std::make_unique<Impl>(descriptor.name, url.Value());
    impl->headers = http_utils::ToHttplibHeaders(descriptor.headers);
    impl->connect_timeout = descriptor.EffectiveTimeout();
    impl->read_timeout = descriptor.EffectiveReadTimeout();

    auto client = http_utils::MakeClient(impl->stream_url, impl->connect_timeout,
                                         impl->read_timeout);
    if (client.IsErr()) {
        return R::Err(client.Error());
    }
    impl->stream_client = std::move(client).Value();

    Impl* raw = impl.get();
    impl->reader = std::thread([raw] { raw->ReaderLoop(); });

    std::unique_ptr<SseTransport> transport(new SseTransport(std::move(impl)));
    auto ready = transport->impl_->AwaitEndpoint();
    if (ready.IsErr()) {
        transport->Close();
        return R::Err(ready.Error());
    }
    return R::Ok(std::move(transport));
}

SseTransport::SseTransport(std::unique_ptr<Impl> impl)
    : impl_(std::move(impl)) {}

SseTransport::~SseTransport() {
    Close();
}

Result<nlohmann::json, Error> SseTransport::Request(
    const std::string& method,
    const nlohmann::json& params,
    std::optional<std::chrono::milliseconds> timeout) {
    if (!impl_->open.load()) {
        return Result<nlohmann::json, Error>::Err(MakeSseError(
            method, impl_->name, "Transport is closed", ErrorCategory::Closed));
    }

    auto ticket = impl_->pending.Register();
    auto posted = impl_->Post(method,
                              jsonrpc::MakeRequest(ticket.id, method, params),
                              timeout.value_or(impl_->read_timeout));
    if (posted.IsErr()) {
        impl_->pending.Cancel(ticket.id);
        return Result<nlohmann::json, Error>::Err(posted.Error());
    }
    return impl_->pending.Await(ticket, method,
                                timeout.value_or(impl_->read_timeout));
}

Result<void, Error> SseTransport::Notify(const std::string& method,
                                         const nlohmann::json& params) {
    if (!impl_->open.load()) {
        return Result<void, Error>::Err(MakeSseError(
            method, impl_->name, "Transport is closed", ErrorCategory::Closed));
    }
    return impl_->Post(method, jsonrpc::MakeNotification(method, params),
                       impl_->connect_timeout);
}

void SseTransport::Close() {
    std::lock_guard<std::mutex> lock(impl_->close_mutex);
    if (impl_->closed) return;
    impl_->closed = true;
    impl_->closing.store(true);
    impl_->open.store(false);

    // stop() only interrupts a socket that is already open, so repeat it
    // until the reader has left the GET.
    {
        std::unique_lock<std::mutex> state_lock(impl_->mutex);
        while (!impl_->reader_done) {
            state_lock.unlock();
            impl_->stream_client->stop();
            state_lock.lock();
            impl_->cv.wait_for(state_lock, kStopPoll,
                               [this] { return impl_->reader_done; });
        }
    }
    if (impl_->reader.joinable()) {
        impl_->reader.join();
    }
    impl_->pending.FailAll(MakeSseError("Close", impl_->name,
                                        "Transport is closed", ErrorCategory::Closed));
    LogDebug("sse", impl_->name + ": closed");
}

bool SseTransport::IsOpen() const {
    return impl_->open.load();
}

std::string SseTransport::MessageEndpoint() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->endpoint.has_value() ? impl_->endpoint->ToString() : "";
}

} // namespace mcp_chat
