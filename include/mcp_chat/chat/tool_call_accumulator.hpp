#pragma once

#include <mcp_chat/chat/language_model.hpp>

#include <map>
#include <vector>

namespace mcp_chat {

// ---------------------------------------------------------------------------
// ToolCallAccumulator — assembles streamed tool-call fragments by index.
//
// A fragment's id replaces the stored id when non-empty; name and argument
// pieces are concatenated in arrival order. Finish() returns the calls
// ordered by index.
// ---------------------------------------------------------------------------
class ToolCallAccumulator {
public:
    void Add(const ToolCallFragment& fragment);

    [[nodiscard]] std::vector<ModelToolCall> Finish() const;
    [[nodiscard]] bool Empty() const { return calls_.empty(); }

    void Reset() { calls_.clear(); }

private:
    std::map<int, ModelToolCall> calls_;
};

} // namespace mcp_chat
