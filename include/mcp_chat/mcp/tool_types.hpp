#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcp_chat {

// ---------------------------------------------------------------------------
// RemoteTool — one entry of a server's tools/list answer.
// ---------------------------------------------------------------------------
struct RemoteTool {
    std::string name;
    std::string description;        // may be empty
    nlohmann::json input_schema;    // JSON Schema object, passed through as-is
};

// ---------------------------------------------------------------------------
// Content blocks of a structured tools/call result.
// ---------------------------------------------------------------------------
struct TextContent {
    std::string text;
};

struct ImageContent {
    std::string data;               // base64
    std::string mime_type;
};

struct ResourceContent {
    std::string uri;
    std::optional<std::string> mime_type;
    std::optional<std::string> text;
};

// Block of a type this client does not model; kept verbatim.
struct UnknownContent {
    nlohmann::json raw;
};

using ContentBlock =
    std::variant<TextContent, ImageContent, ResourceContent, UnknownContent>;

struct StructuredContent {
    std::vector<ContentBlock> blocks;
    bool is_error = false;
};

// Payload that is neither structured content nor usable JSON.
struct OpaqueResult {
    std::string text;
};

// ---------------------------------------------------------------------------
// ToolResult — raw result of tools/call, classified once when it leaves the
// protocol layer:
//   std::string         plain text result
//   StructuredContent   "content" blocks + "isError"
//   nlohmann::json      any other JSON value
//   OpaqueResult        malformed payload, rendered as text
// ---------------------------------------------------------------------------
using ToolResult =
    std::variant<std::string, StructuredContent, nlohmann::json, OpaqueResult>;

/// Classify a tools/call "result" member.
ToolResult ClassifyToolResult(const nlohmann::json& result);

/// Parse one content block ({"type":"text",...}, {"type":"image",...}, ...).
ContentBlock ParseContentBlock(const nlohmann::json& block);

/// Render a content block in wire shape.
nlohmann::json ContentBlockToJson(const ContentBlock& block);

/// Human-readable variant name used in diagnostics.
std::string ToolResultTypeName(const ToolResult& result);

/// Parse one tools/list entry. Missing fields become empty values.
RemoteTool ParseRemoteTool(const nlohmann::json& entry);

} // namespace mcp_chat
