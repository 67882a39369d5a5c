#pragma once

#include <mcp_chat/core/result.hpp>
#include <mcp_chat/mcp/i_transport.hpp>
#include <mcp_chat/mcp/tool_types.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcp_chat {

// ---------------------------------------------------------------------------
// ServerCapabilities — what the server reported from initialize.
// ---------------------------------------------------------------------------
struct ServerCapabilities {
    std::string protocol_version;
    std::string server_name;
    std::string server_version;
    nlohmann::json capabilities = nlohmann::json::object();
    std::string instructions;
};

// ---------------------------------------------------------------------------
// McpSession — MCP 2024-11-05 client protocol over one transport.
//
// Owns the transport. Initialize() must succeed before ListTools() and
// CallTool(). CallTool() may be called from several threads at once.
// ---------------------------------------------------------------------------
class McpSession {
public:
    McpSession(std::string server_name, std::unique_ptr<ITransport> transport);
    ~McpSession();

    McpSession(const McpSession&) = delete;
    McpSession& operator=(const McpSession&) = delete;

    /// initialize + notifications/initialized.
    [[nodiscard]] Result<ServerCapabilities, Error> Initialize(
        std::chrono::milliseconds timeout);

    /// tools/list, following nextCursor until the listing is complete.
    [[nodiscard]] Result<std::vector<RemoteTool>, Error> ListTools(
        std::chrono::milliseconds timeout);

    /// tools/call. The result is classified into a ToolResult. A result with
    /// isError set is still Ok: it is the tool's answer.
    [[nodiscard]] Result<ToolResult, Error> CallTool(
        const std::string& tool,
        const nlohmann::json& arguments,
        std::optional<std::chrono::milliseconds> timeout);

    void Close();

    [[nodiscard]] bool IsOpen() const;
    [[nodiscard]] TransportKind Kind() const { return transport_->Kind(); }
    [[nodiscard]] const std::string& ServerName() const { return server_name_; }

private:
    std::string server_name_;
    std::unique_ptr<ITransport> transport_;
    bool initialized_ = false;
};

} // namespace mcp_chat
