#include <mcp_chat/chat/tool_call_accumulator.hpp>

namespace mcp_chat {

void ToolCallAccumulator::Add(const ToolCallFragment& fragment) {
    auto& call = calls_[fragment.index];
    if (!fragment.id.empty()) {
        call.id = fragment.id;
    }
    call.name += fragment.name;
    call.arguments += fragment.arguments;
}

std::vector<ModelToolCall> ToolCallAccumulator::Finish() const {
    std::vector<ModelToolCall> out;
    out.reserve(calls_.size());
    for (const auto& [index, call] : calls_) {
        out.push_back(call);
    }
    return out;
}

} // namespace mcp_chat
