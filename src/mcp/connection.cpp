#include <mcp_chat/mcp/connection.hpp>

#include <mcp_chat/core/log.hpp>

namespace mcp_chat {

Connection::Connection(std::string name,
                       std::unique_ptr<McpSession> session,
                       std::vector<RemoteTool> tools,
                       ServerCapabilities capabilities)
    : name_(std::move(name)),
      kind_(session->Kind()),
      session_(std::move(session)),
      tools_(std::move(tools)),
      capabilities_(std::move(capabilities)),
      connected_at_(std::chrono::system_clock::now()),
      connected_steady_(std::chrono::steady_clock::now()) {}

Connection::~Connection() {
    Close();
}

Result<ToolResult, Error> Connection::CallTool(
    const std::string& tool,
    const nlohmann::json& arguments,
    std::optional<std::chrono::milliseconds> timeout) {
    if (closed_.load()) {
        return Result<ToolResult, Error>::Err(Error{
            "CallTool", name_ + "/" + tool, std::nullopt,
            "Connection to server '" + name_ + "' is closed",
            std::nullopt, ErrorCategory::Closed});
    }
    auto result = session_->CallTool(tool, arguments, timeout);
    if (result.IsErr() && closed_.load()) {
        // Closed while the call was in flight.
        auto error = std::move(result).Error();
        error.category = ErrorCategory::Closed;
        error.message = "Connection to server '" + name_ + "' is closed";
        return Result<ToolResult, Error>::Err(std::move(error));
    }
    return result;
}

void Connection::Close() {
    std::lock_guard<std::mutex> lock(close_mutex_);
    if (closed_.exchange(true)) return;
    session_->Close();
    LogInfo("registry", "Closed connection '" + name_ + "'");
}

const RemoteTool* Connection::FindTool(const std::string& tool) const {
    for (const auto& t : tools_) {
        if (t.name == tool) return &t;
    }
    return nullptr;
}

std::chrono::milliseconds Connection::Uptime() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - connected_steady_);
}

} // namespace mcp_chat
