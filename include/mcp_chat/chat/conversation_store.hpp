#pragma once

#include <mcp_chat/chat/message.hpp>
#include <mcp_chat/core/result.hpp>

#include <mutex>
#include <string>
#include <vector>

namespace mcp_chat {

// ---------------------------------------------------------------------------
// IConversationStore — persists conversation history between sessions.
// ---------------------------------------------------------------------------
class IConversationStore {
public:
    virtual ~IConversationStore() = default;

    // Non-copyable, non-movable (polymorphic base).
    IConversationStore(const IConversationStore&) = delete;
    IConversationStore& operator=(const IConversationStore&) = delete;
    IConversationStore(IConversationStore&&) = delete;
    IConversationStore& operator=(IConversationStore&&) = delete;

    /// All stored messages in order. A store that does not exist yet is empty.
    [[nodiscard]] virtual Result<std::vector<ConversationMessage>, Error> Load() = 0;

    /// Append messages after the stored ones.
    [[nodiscard]] virtual Result<void, Error> Append(
        const std::vector<ConversationMessage>& messages) = 0;

    /// Remove every stored message.
    [[nodiscard]] virtual Result<void, Error> Clear() = 0;

protected:
    IConversationStore() = default;
};

// ---------------------------------------------------------------------------
// JsonFileConversationStore — one JSON document per conversation:
//   {"version": 1, "messages": [ ... ]}
// Writes go to a temporary file that replaces the document.
// ---------------------------------------------------------------------------
class JsonFileConversationStore : public IConversationStore {
public:
    static constexpr int kFormatVersion = 1;

    explicit JsonFileConversationStore(std::string path);

    [[nodiscard]] Result<std::vector<ConversationMessage>, Error> Load() override;
    [[nodiscard]] Result<void, Error> Append(
        const std::vector<ConversationMessage>& messages) override;
    [[nodiscard]] Result<void, Error> Clear() override;

    [[nodiscard]] const std::string& Path() const { return path_; }

private:
    Result<std::vector<ConversationMessage>, Error> LoadLocked() const;
    Result<void, Error> WriteLocked(const std::vector<ConversationMessage>& messages) const;

    std::string path_;
    mutable std::mutex mutex_;
};

} // namespace mcp_chat
