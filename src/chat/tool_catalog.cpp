#include <mcp_chat/chat/tool_catalog.hpp>

#include <mcp_chat/core/log.hpp>
#include <mcp_chat/mcp/server_descriptor.hpp>
#include <mcp_chat/mcp/session_registry.hpp>

namespace mcp_chat {

nlohmann::json DefaultInputSchema() {
    return {
        {"type", "object"},
        {"properties", nlohmann::json::object()},
        {"required", nlohmann::json::array()},
    };
}

nlohmann::json ParseToolArguments(const std::string& arguments_json) {
    if (arguments_json.empty()) {
        return nlohmann::json::object();
    }
    auto parsed = nlohmann::json::parse(arguments_json, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        LogWarn("engine", "Ignoring malformed tool arguments: " + arguments_json);
        return nlohmann::json::object();
    }
    return parsed;
}

std::string ToolDescriptor::FullName() const {
    return server_name + kToolNameSeparator + tool_name;
}

// ---------------------------------------------------------------------------
// Build
// ---------------------------------------------------------------------------
ToolCatalog ToolCatalog::Build(const SessionRegistry& registry) {
    return FromTools(registry.ListTools());
}

ToolCatalog ToolCatalog::FromTools(
    const std::map<std::string, std::vector<RemoteTool>>& tools_by_server) {
    ToolCatalog catalog;
    for (const auto& [server, tools] : tools_by_server) {
        for (const auto& tool : tools) {
            ToolDescriptor d;
            d.server_name = server;
            d.tool_name = tool.name;
            d.description = tool.description.empty()
                                ? "Tool " + tool.name + " from " + server
                                : tool.description;
            d.input_schema = tool.input_schema.is_null() ? DefaultInputSchema()
                                                         : tool.input_schema;
            auto full_name = d.FullName();
            catalog.entries_.emplace(std::move(full_name), std::move(d));
        }
    }
    return catalog;
}

nlohmann::json ToolCatalog::ToModelSchema() const {
    auto schema = nlohmann::json::array();
    for (const auto& [full_name, d] : entries_) {
        schema.push_back({
            {"type", "function"},
            {"function", {
                {"name", full_name},
                {"description", d.description},
                {"parameters", d.input_schema},
            }},
        });
    }
    return schema;
}

const ToolDescriptor* ToolCatalog::Find(const std::string& full_name) const {
    auto it = entries_.find(full_name);
    return it == entries_.end() ? nullptr : &it->second;
}

// ---------------------------------------------------------------------------
// ResolveFunctionCall
// ---------------------------------------------------------------------------
ToolCallRequest ToolCatalog::ResolveFunctionCall(const std::string& id,
                                                 const std::string& function_name,
                                                 const std::string& arguments_json) const {
    ToolCallRequest request;
    request.id = id;
    request.function_name = function_name;
    request.arguments = ParseToolArguments(arguments_json);

    const std::string separator = kToolNameSeparator;
    auto pos = function_name.find(separator);
    if (pos != std::string::npos) {
        request.server_name = function_name.substr(0, pos);
        request.tool_name = function_name.substr(pos + separator.size());
        return request;
    }

    const ToolDescriptor* match = nullptr;
    for (const auto& [_, d] : entries_) {
        if (d.tool_name != function_name) continue;
        if (match != nullptr) {
            LogWarn("engine", "Ambiguous tool name '" + function_name + "'");
            match = nullptr;
            break;
        }
        match = &d;
    }
    if (match != nullptr) {
        request.server_name = match->server_name;
        request.tool_name = match->tool_name;
    } else {
        request.tool_name = function_name;
    }
    return request;
}

} // namespace mcp_chat
