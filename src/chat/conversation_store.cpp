#include <mcp_chat/chat/conversation_store.hpp>

#include <mcp_chat/core/log.hpp>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>

#include <sys/stat.h>

#include <nlohmann/json.hpp>

namespace mcp_chat {

namespace {

Error MakeStoreError(const std::string& operation, const std::string& path,
                     const std::string& message) {
    return Error{operation, path, std::nullopt, message, std::nullopt,
                 ErrorCategory::Storage};
}

} // anonymous namespace

JsonFileConversationStore::JsonFileConversationStore(std::string path)
    : path_(std::move(path)) {}

// ---------------------------------------------------------------------------
// Load
// ---------------------------------------------------------------------------
Result<std::vector<ConversationMessage>, Error> JsonFileConversationStore::Load() {
    std::lock_guard<std::mutex> lock(mutex_);
    return LoadLocked();
}

Result<std::vector<ConversationMessage>, Error> JsonFileConversationStore::LoadLocked() const {
    using R = Result<std::vector<ConversationMessage>, Error>;

    std::ifstream ifs(path_);
    if (!ifs) {
        struct stat st{};
        if (stat(path_.c_str(), &st) != 0 && errno == ENOENT) {
            return R::Ok(std::vector<ConversationMessage>{});
        }
        return R::Err(MakeStoreError("LoadHistory", path_, "Failed to open history file"));
    }

    nlohmann::json j;
    try {
        ifs >> j;
    } catch (const nlohmann::json::parse_error& e) {
        return R::Err(MakeStoreError("LoadHistory", path_,
                                     "Malformed JSON: " + std::string(e.what())));
    }

    if (!j.is_object() || !j.contains("messages") || !j["messages"].is_array()) {
        return R::Err(MakeStoreError("LoadHistory", path_,
                                     "History file has no 'messages' array"));
    }
    const int version = j.value("version", kFormatVersion);
    if (version != kFormatVersion) {
        return R::Err(MakeStoreError("LoadHistory", path_,
                                     "Unsupported history format version " +
                                         std::to_string(version)));
    }

    std::vector<ConversationMessage> messages;
    messages.reserve(j["messages"].size());
    for (const auto& entry : j["messages"]) {
        auto parsed = ConversationMessage::FromJson(entry);
        if (parsed.IsErr()) {
            auto error = std::move(parsed).Error();
            error.operation = "LoadHistory";
            error.target = path_;
            return R::Err(std::move(error));
        }
        messages.push_back(std::move(parsed).Value());
    }
    LogDebug("store", "Loaded " + std::to_string(messages.size()) + " messages from " +
                          path_);
    return R::Ok(std::move(messages));
}

// ---------------------------------------------------------------------------
// Append / Clear
// ---------------------------------------------------------------------------
Result<void, Error> JsonFileConversationStore::Append(
    const std::vector<ConversationMessage>& messages) {
    if (messages.empty()) {
        return Result<void, Error>::Ok();
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto existing = LoadLocked();
    if (existing.IsErr()) {
        return Result<void, Error>::Err(std::move(existing).Error());
    }
    auto all = std::move(existing).Value();
    all.insert(all.end(), messages.begin(), messages.end());
    return WriteLocked(all);
}

Result<void, Error> JsonFileConversationStore::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    return WriteLocked({});
}

Result<void, Error> JsonFileConversationStore::WriteLocked(
    const std::vector<ConversationMessage>& messages) const {
    nlohmann::json j;
    j["version"] = kFormatVersion;
    j["messages"] = nlohmann::json::array();
    for (const auto& m : messages) {
        j["messages"].push_back(m.ToJson());
    }

    const std::string tmp_path = path_ + ".tmp";
    {
        std::ofstream ofs(tmp_path);
        if (!ofs) {
            return Result<void, Error>::Err(
                MakeStoreError("SaveHistory", tmp_path, "Failed to open file for writing"));
        }
        ofs << j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
        if (!ofs) {
            return Result<void, Error>::Err(
                MakeStoreError("SaveHistory", tmp_path, "Failed to write history"));
        }
    }
    // Set file permissions to owner read/write only (chmod 600).
    chmod(tmp_path.c_str(), S_IRUSR | S_IWUSR);

    if (std::rename(tmp_path.c_str(), path_.c_str()) != 0) {
        const std::string reason = std::strerror(errno);
        std::remove(tmp_path.c_str());
        return Result<void, Error>::Err(
            MakeStoreError("SaveHistory", path_, "Failed to replace history file: " + reason));
    }
    LogDebug("store", "Saved " + std::to_string(messages.size()) + " messages to " + path_);
    return Result<void, Error>::Ok();
}

} // namespace mcp_chat
