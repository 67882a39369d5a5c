#include <mcp_chat/mcp/tool_types.hpp>

namespace mcp_chat {

namespace {

std::string StringField(const nlohmann::json& obj, const char* key) {
    if (obj.is_object() && obj.contains(key) && obj[key].is_string()) {
        return obj[key].get<std::string>();
    }
    return "";
}

std::optional<std::string> OptionalStringField(const nlohmann::json& obj,
                                               const char* key) {
    if (obj.is_object() && obj.contains(key) && obj[key].is_string()) {
        return obj[key].get<std::string>();
    }
    return std::nullopt;
}

} // anonymous namespace

ContentBlock ParseContentBlock(const nlohmann::json& block) {
    const auto type = StringField(block, "type");
    if (type == "text") {
        return TextContent{StringField(block, "text")};
    }
    if (type == "image") {
        return ImageContent{StringField(block, "data"),
                            StringField(block, "mimeType")};
    }
    if (type == "resource" && block.contains("resource") &&
        block["resource"].is_object()) {
        const auto& res = block["resource"];
        return ResourceContent{StringField(res, "uri"),
                               OptionalStringField(res, "mimeType"),
                               OptionalStringField(res, "text")};
    }
    return UnknownContent{block};
}

nlohmann::json ContentBlockToJson(const ContentBlock& block) {
    if (const auto* text = std::get_if<TextContent>(&block)) {
        return {{"type", "text"}, {"text", text->text}};
    }
    if (const auto* image = std::get_if<ImageContent>(&block)) {
        return {{"type", "image"},
                {"data", image->data},
                {"mimeType", image->mime_type}};
    }
    if (const auto* res = std::get_if<ResourceContent>(&block)) {
        nlohmann::json resource = {{"uri", res->uri}};
        resource["mimeType"] = res->mime_type.has_value()
                                   ? nlohmann::json(*res->mime_type)
                                   : nlohmann::json(nullptr);
        resource["text"] = res->text.has_value()
                               ? nlohmann::json(*res->text)
                               : nlohmann::json(nullptr);
        return {{"type", "resource"}, {"resource", resource}};
    }
    // Unknown block: keep the raw payload under "data".
    return {{"data", std::get<UnknownContent>(block).raw.dump(
                 -1, ' ', false, nlohmann::json::error_handler_t::replace)}};
}

ToolResult ClassifyToolResult(const nlohmann::json& result) {
    if (result.is_string()) {
        return ToolResult{std::in_place_index<0>, result.get<std::string>()};
    }
    if (result.is_object() && result.contains("content")) {
        const auto& content = result["content"];
        if (!content.is_array()) {
            return OpaqueResult{content.is_string()
                                    ? content.get<std::string>()
                                    : content.dump(-1, ' ', false,
                                          nlohmann::json::error_handler_t::replace)};
        }
        StructuredContent structured;
        for (const auto& block : content) {
            structured.blocks.push_back(ParseContentBlock(block));
        }
        structured.is_error =
            result.contains("isError") && result["isError"].is_boolean() &&
            result["isError"].get<bool>();
        return structured;
    }
    return ToolResult{std::in_place_index<2>, result};
}

std::string ToolResultTypeName(const ToolResult& result) {
    switch (result.index()) {
        case 0: return "string";
        case 1: return "StructuredContent";
        case 2: return "json";
        case 3: return "OpaqueResult";
    }
    return "unknown";
}

RemoteTool ParseRemoteTool(const nlohmann::json& entry) {
    RemoteTool tool;
    tool.name = StringField(entry, "name");
    tool.description = StringField(entry, "description");
    if (entry.is_object() && entry.contains("inputSchema") &&
        entry["inputSchema"].is_object()) {
        tool.input_schema = entry["inputSchema"];
    }
    return tool;
}

} // namespace mcp_chat
