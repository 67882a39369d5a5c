#pragma once

#include <mcp_chat/core/result.hpp>
#include <mcp_chat/mcp/connection.hpp>
#include <mcp_chat/mcp/server_descriptor.hpp>
#include <mcp_chat/mcp/tool_types.hpp>
#include <mcp_chat/mcp/transport_connector.hpp>

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcp_chat {

struct RetryPolicy {
    int attempts = 0;                              // retries after the first try
    std::chrono::milliseconds delay{2'000};
};

// ---------------------------------------------------------------------------
// ServerInfo — read-only view of one registered connection.
// ---------------------------------------------------------------------------
struct ServerInfo {
    std::string name;
    TransportKind transport = TransportKind::Stdio;
    std::vector<std::string> tools;
    std::chrono::system_clock::time_point connected_at;
    std::chrono::milliseconds uptime{0};
    int attempts = 1;
};

// Outcome of one descriptor in AddMany.
struct AddOutcome {
    std::string name;
    Result<ServerInfo, Error> result;
};

// ---------------------------------------------------------------------------
// SessionRegistry — owns every live Connection, keyed by server name.
//
// All map mutations happen under one mutex; connecting and calling tools
// happen outside it, so a slow handshake never blocks calls on other
// servers. Names are unique for the lifetime of a connection. Calls on a
// removed name, or on any name after CloseAll(), fail with
// ErrorCategory::Closed. CloseAll() is final.
// ---------------------------------------------------------------------------
class SessionRegistry {
public:
    explicit SessionRegistry(IConnector& connector);
    ~SessionRegistry();

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    /// Connect one server, trying up to `retry.attempts + 1` times.
    /// Configuration errors are not retried.
    [[nodiscard]] Result<ServerInfo, Error> AddOne(const ServerDescriptor& descriptor,
                                                   RetryPolicy retry = {});

    /// Connect several servers. With fail_fast == false all descriptors are
    /// attempted concurrently and one outcome per descriptor is returned in
    /// input order. With fail_fast == true they are attempted in order and
    /// the first failure stops the batch; outcomes cover the attempted
    /// descriptors only.
    [[nodiscard]] std::vector<AddOutcome> AddMany(
        const std::vector<ServerDescriptor>& descriptors,
        bool fail_fast,
        RetryPolicy retry = {});

    /// Invoke `tool` on `server`. `timeout` bounds the wait for the answer.
    [[nodiscard]] Result<ToolResult, Error> Call(
        const std::string& server,
        const std::string& tool,
        const nlohmann::json& arguments,
        std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    /// Close and evict one connection. Returns false if `name` was not
    /// registered.
    bool Remove(const std::string& name);

    /// Close every connection on the calling thread, one after another, and
    /// refuse further adds.
    void CloseAll();

    [[nodiscard]] std::vector<std::string> ListServers() const;
    [[nodiscard]] std::map<std::string, std::vector<RemoteTool>> ListTools() const;
    [[nodiscard]] Result<std::vector<RemoteTool>, Error> ListTools(
        const std::string& server) const;
    [[nodiscard]] Result<ServerInfo, Error> GetServerInfo(const std::string& name) const;

    [[nodiscard]] bool IsClosed() const;
    [[nodiscard]] std::size_t Size() const;

private:
    Result<ServerInfo, Error> ConnectWithRetry(const ServerDescriptor& descriptor,
                                               const RetryPolicy& retry);
    std::string ServerListLocked() const;

    IConnector& connector_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Connection>> connections_;
    std::set<std::string> pending_names_;   // adds in progress
    std::set<std::string> evicted_names_;   // removed or closed connections
    bool closed_ = false;
};

/// Snapshot of a connection for callers outside the registry.
ServerInfo MakeServerInfo(const Connection& connection);

} // namespace mcp_chat
