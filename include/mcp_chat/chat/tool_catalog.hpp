#pragma once

#include <mcp_chat/chat/message.hpp>
#include <mcp_chat/mcp/tool_types.hpp>

#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcp_chat {

class SessionRegistry;

// ---------------------------------------------------------------------------
// ToolDescriptor — one tool as offered to the model.
// ---------------------------------------------------------------------------
struct ToolDescriptor {
    std::string server_name;
    std::string tool_name;
    std::string description;
    nlohmann::json input_schema;

    [[nodiscard]] std::string FullName() const;
};

// ---------------------------------------------------------------------------
// ToolCatalog — every tool of every connected server, keyed by
// "server__tool". A catalog is a snapshot; build a fresh one whenever the
// registry may have changed.
// ---------------------------------------------------------------------------
class ToolCatalog {
public:
    ToolCatalog() = default;

    static ToolCatalog Build(const SessionRegistry& registry);
    static ToolCatalog FromTools(
        const std::map<std::string, std::vector<RemoteTool>>& tools_by_server);

    /// Function-call schema list: [{"type":"function","function":{name,
    /// description, parameters}}], in full-name order.
    [[nodiscard]] nlohmann::json ToModelSchema() const;

    /// Turn one model function call into a request. Names containing "__"
    /// split at the first separator; bare names resolve when exactly one
    /// catalog entry has that tool name. Arguments that are not a JSON
    /// object become {}.
    [[nodiscard]] ToolCallRequest ResolveFunctionCall(
        const std::string& id,
        const std::string& function_name,
        const std::string& arguments_json) const;

    [[nodiscard]] const ToolDescriptor* Find(const std::string& full_name) const;
    [[nodiscard]] const std::map<std::string, ToolDescriptor>& Entries() const {
        return entries_;
    }
    [[nodiscard]] std::size_t Size() const { return entries_.size(); }
    [[nodiscard]] bool Empty() const { return entries_.empty(); }

private:
    std::map<std::string, ToolDescriptor> entries_;
};

/// Schema used when a server does not publish one.
nlohmann::json DefaultInputSchema();

/// Parse model-supplied argument text. Invalid or non-object JSON yields {}.
nlohmann::json ParseToolArguments(const std::string& arguments_json);

} // namespace mcp_chat
