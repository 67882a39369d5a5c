#pragma once

#include <mcp_chat/mcp/server_descriptor.hpp>

#include <optional>
#include <string>
#include <vector>

namespace mcp_chat {

struct ModelConfig {
    std::string name = "anthropic/claude-3.5-sonnet";
    std::string base_url = "https://openrouter.ai/api/v1";
    std::string api_key;
    std::string api_key_env = "OPENROUTER_API_KEY"; // env var name to read the key from
    double temperature = 0.7;
};

struct ChatConfig {
    std::optional<std::string> system_prompt;       // unset: built-in default
    int max_iterations = 10;
    int tool_timeout_seconds = 30;
    bool stream = true;
};

struct ConnectConfig {
    int retry_attempts = 0;
    double retry_delay_seconds = 2.0;
    bool fail_fast = false;
};

struct AppConfig {
    ModelConfig model;
    ChatConfig chat;
    ConnectConfig connect;
    std::vector<ServerDescriptor> servers;
    std::optional<std::string> config_path;
    std::optional<std::string> history_file;
    std::optional<std::string> log_file;
    std::string log_level = "info";
    bool json_logs = false;
    int verbosity = 0;                              // count of -v flags
    std::optional<std::string> message;             // one-shot message
};

} // namespace mcp_chat
