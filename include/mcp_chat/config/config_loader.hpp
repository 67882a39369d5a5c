#pragma once

#include <mcp_chat/config/app_config.hpp>
#include <mcp_chat/core/result.hpp>

#include <string>
#include <string_view>

namespace mcp_chat {

// Parse a YAML config file into an AppConfig.
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

// Parse YAML text; used by LoadFromYaml and by tests.
Result<AppConfig, Error> LoadFromYamlString(const std::string& yaml_text);

// Parse CLI arguments into an AppConfig.
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv);

// Merge two configs: cli_overrides take precedence over yaml_base.
// Fields set in cli_overrides replace those in yaml_base.
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides);

// Resolve api_key_env: if api_key is empty and api_key_env is set,
// read the environment variable and populate api_key.
Result<AppConfig, Error> ResolveApiKeyEnv(AppConfig config);

// Validate that all required fields are present and values are sane.
Result<void, Error> ValidateConfig(const AppConfig& config);

} // namespace mcp_chat
