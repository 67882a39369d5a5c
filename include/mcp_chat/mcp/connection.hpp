#pragma once

#include <mcp_chat/core/result.hpp>
#include <mcp_chat/mcp/mcp_session.hpp>
#include <mcp_chat/mcp/server_descriptor.hpp>
#include <mcp_chat/mcp/tool_types.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mcp_chat {

// ---------------------------------------------------------------------------
// Connection — one live server: its session plus the tool list it
// advertised at connect time.
//
// The tool list is a snapshot and never changes. Once Close() has run the
// connection rejects calls with ErrorCategory::Closed and cannot be reopened.
// ---------------------------------------------------------------------------
class Connection {
public:
    Connection(std::string name,
               std::unique_ptr<McpSession> session,
               std::vector<RemoteTool> tools,
               ServerCapabilities capabilities = {});
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    [[nodiscard]] Result<ToolResult, Error> CallTool(
        const std::string& tool,
        const nlohmann::json& arguments,
        std::optional<std::chrono::milliseconds> timeout);

    /// Idempotent.
    void Close();

    [[nodiscard]] bool IsClosed() const { return closed_.load(); }

    [[nodiscard]] const std::string& Name() const { return name_; }
    [[nodiscard]] TransportKind Kind() const { return kind_; }
    [[nodiscard]] const std::vector<RemoteTool>& Tools() const { return tools_; }
    [[nodiscard]] const RemoteTool* FindTool(const std::string& tool) const;
    [[nodiscard]] const ServerCapabilities& Capabilities() const { return capabilities_; }

    [[nodiscard]] std::chrono::system_clock::time_point ConnectedAt() const {
        return connected_at_;
    }
    [[nodiscard]] std::chrono::milliseconds Uptime() const;

    /// Number of connect attempts that produced this connection.
    [[nodiscard]] int Attempts() const { return attempts_; }
    void SetAttempts(int attempts) { attempts_ = attempts; }

private:
    std::string name_;
    TransportKind kind_;
    std::unique_ptr<McpSession> session_;
    const std::vector<RemoteTool> tools_;
    ServerCapabilities capabilities_;
    std::chrono::system_clock::time_point connected_at_;
    std::chrono::steady_clock::time_point connected_steady_;
    int attempts_ = 1;

    std::atomic<bool> closed_{false};
    std::mutex close_mutex_;
};

} // namespace mcp_chat
