#include <mcp_chat/mcp/mcp_session.hpp>

#include <mcp_chat/core/log.hpp>
#include <mcp_chat/core/version.hpp>
#include <mcp_chat/mcp/json_rpc.hpp>

#include <set>

namespace mcp_chat {

namespace {

// Upper bound on tools/list pages; guards against servers that keep
// returning a cursor.
constexpr int kMaxToolPages = 100;

Error MakeSessionError(const std::string& operation, const std::string& target,
                       const std::string& message,
                       ErrorCategory category = ErrorCategory::Protocol) {
    return Error{operation, target, std::nullopt, message, std::nullopt, category};
}

} // anonymous namespace

McpSession::McpSession(std::string server_name,
                       std::unique_ptr<ITransport> transport)
    : server_name_(std::move(server_name)), transport_(std::move(transport)) {}

McpSession::~McpSession() {
    Close();
}

Result<ServerCapabilities, Error> McpSession::Initialize(
    std::chrono::milliseconds timeout) {
    using R = Result<ServerCapabilities, Error>;

    nlohmann::json params = {
        {"protocolVersion", kMcpProtocolVersion},
        {"capabilities", nlohmann::json::object()},
        {"clientInfo", {
            {"name", "mcp-chat"},
            {"version", kVersion}
        }}
    };

    auto response = transport_->Request("initialize", params, timeout);
    if (response.IsErr()) {
        return R::Err(response.Error());
    }
    const auto& result = response.Value();
    if (!result.is_object()) {
        return R::Err(MakeSessionError("initialize", server_name_,
                                       "initialize result is not an object"));
    }

    ServerCapabilities caps;
    caps.protocol_version = result.value("protocolVersion", "");
    if (result.contains("serverInfo") && result["serverInfo"].is_object()) {
        caps.server_name = result["serverInfo"].value("name", "");
        caps.server_version = result["serverInfo"].value("version", "");
    }
    if (result.contains("capabilities") && result["capabilities"].is_object()) {
        caps.capabilities = result["capabilities"];
    }
    if (result.contains("instructions") && result["instructions"].is_string()) {
        caps.instructions = result["instructions"].get<std::string>();
    }
    if (!caps.protocol_version.empty() &&
        caps.protocol_version != kMcpProtocolVersion) {
        LogDebug("connector", server_name_ + ": server speaks protocol " +
                                  caps.protocol_version);
    }

    auto notified = transport_->Notify("notifications/initialized",
                                       nlohmann::json::object());
    if (notified.IsErr()) {
        return R::Err(notified.Error());
    }

    initialized_ = true;
    return R::Ok(std::move(caps));
}

Result<std::vector<RemoteTool>, Error> McpSession::ListTools(
    std::chrono::milliseconds timeout) {
    using R = Result<std::vector<RemoteTool>, Error>;
    if (!initialized_) {
        return R::Err(MakeSessionError("tools/list", server_name_,
                                       "Session is not initialized",
                                       ErrorCategory::Internal));
    }

    std::vector<RemoteTool> tools;
    std::set<std::string> seen_cursors;
    std::optional<std::string> cursor;
    for (int page = 0; page < kMaxToolPages; ++page) {
        nlohmann::json params = nlohmann::json::object();
        if (cursor.has_value()) {
            params["cursor"] = *cursor;
        }
        auto response = transport_->Request("tools/list", params, timeout);
        if (response.IsErr()) {
            return R::Err(response.Error());
        }
        const auto& result = response.Value();
        if (!result.is_object() || !result.contains("tools") ||
            !result["tools"].is_array()) {
            return R::Err(MakeSessionError("tools/list", server_name_,
                                           "tools/list result has no 'tools' array"));
        }
        for (const auto& entry : result["tools"]) {
            auto tool = ParseRemoteTool(entry);
            if (tool.name.empty()) {
                LogWarn("connector", server_name_ + ": skipping tool without a name");
                continue;
            }
            tools.push_back(std::move(tool));
        }

        if (!result.contains("nextCursor") || !result["nextCursor"].is_string()) {
            return R::Ok(std::move(tools));
        }
        cursor = result["nextCursor"].get<std::string>();
        if (cursor->empty() || !seen_cursors.insert(*cursor).second) {
            return R::Ok(std::move(tools));
        }
    }
    LogWarn("connector", server_name_ + ": tools/list stopped after " +
                             std::to_string(kMaxToolPages) + " pages");
    return R::Ok(std::move(tools));
}

Result<ToolResult, Error> McpSession::CallTool(
    const std::string& tool,
    const nlohmann::json& arguments,
    std::optional<std::chrono::milliseconds> timeout) {
    using R = Result<ToolResult, Error>;
    if (!initialized_) {
        return R::Err(MakeSessionError("tools/call", server_name_,
                                       "Session is not initialized",
                                       ErrorCategory::Internal));
    }

    nlohmann::json params = {
        {"name", tool},
        {"arguments", arguments.is_object() ? arguments : nlohmann::json::object()}
    };
    auto response = transport_->Request("tools/call", params, timeout);
    if (response.IsErr()) {
        auto error = std::move(response).Error();
        error.target = server_name_ + "/" + tool;
        return R::Err(std::move(error));
    }
    return R::Ok(ClassifyToolResult(response.Value()));
}

void McpSession::Close() {
    if (transport_) {
        transport_->Close();
    }
}

bool McpSession::IsOpen() const {
    return transport_ && transport_->IsOpen();
}

} // namespace mcp_chat
