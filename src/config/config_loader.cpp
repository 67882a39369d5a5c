#include <mcp_chat/config/config_loader.hpp>

#include <mcp_chat/core/log.hpp>
#include <mcp_chat/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <cmath>
#include <cstdlib>
#include <set>

namespace mcp_chat {

namespace {

Error MakeConfigError(const std::string& message) {
    return Error{"ConfigLoader", "", std::nullopt, message, std::nullopt,
                 ErrorCategory::Configuration};
}

std::chrono::milliseconds SecondsToMs(double seconds) {
    return std::chrono::milliseconds(static_cast<long long>(std::llround(seconds * 1000.0)));
}

// Build a ServerDescriptor from a parsed YAML node.
Result<ServerDescriptor, Error> ParseYamlServer(const YAML::Node& node) {
    if (!node["name"]) {
        return Result<ServerDescriptor, Error>::Err(
            MakeConfigError("Server entry missing 'name' field"));
    }
    const auto name = node["name"].as<std::string>();
    if (!node["transport"]) {
        return Result<ServerDescriptor, Error>::Err(
            MakeConfigError("Server '" + name + "' missing 'transport' field"));
    }
    const auto transport_str = node["transport"].as<std::string>();
    auto transport = ParseTransportKind(transport_str);
    if (!transport.has_value()) {
        return Result<ServerDescriptor, Error>::Err(
            MakeConfigError("Server '" + name + "' has unknown transport '" +
                            transport_str + "'"));
    }

    ServerDescriptor d;
    d.name = name;
    d.transport = *transport;
    if (node["command"]) {
        d.command = node["command"].as<std::string>();
    }
    if (node["args"]) {
        for (const auto& arg : node["args"]) {
            d.args.push_back(arg.as<std::string>());
        }
    }
    if (node["env"]) {
        for (const auto& kv : node["env"]) {
            d.env[kv.first.as<std::string>()] = kv.second.as<std::string>();
        }
    }
    if (node["cwd"]) {
        d.cwd = node["cwd"].as<std::string>();
    }
    if (node["url"]) {
        d.url = node["url"].as<std::string>();
    }
    if (node["headers"]) {
        for (const auto& kv : node["headers"]) {
            d.headers[kv.first.as<std::string>()] = kv.second.as<std::string>();
        }
    }
    if (node["timeout"]) {
        d.timeout = SecondsToMs(node["timeout"].as<double>());
    }
    if (node["sse_read_timeout"]) {
        d.sse_read_timeout = SecondsToMs(node["sse_read_timeout"].as<double>());
    }
    return Result<ServerDescriptor, Error>::Ok(std::move(d));
}

Result<AppConfig, Error> ParseYamlRoot(const YAML::Node& root) {
    AppConfig config;

    // -- Model --
    if (root["model"]) {
        const auto& model = root["model"];
        if (model["name"]) {
            config.model.name = model["name"].as<std::string>();
        }
        if (model["base_url"]) {
            config.model.base_url = model["base_url"].as<std::string>();
        }
        if (model["api_key"]) {
            config.model.api_key = model["api_key"].as<std::string>();
        }
        if (model["api_key_env"]) {
            config.model.api_key_env = model["api_key_env"].as<std::string>();
        }
        if (model["temperature"]) {
            config.model.temperature = model["temperature"].as<double>();
        }
    }

    // -- Chat --
    if (root["chat"]) {
        const auto& chat = root["chat"];
        if (chat["system_prompt"]) {
            config.chat.system_prompt = chat["system_prompt"].as<std::string>();
        }
        if (chat["max_iterations"]) {
            config.chat.max_iterations = chat["max_iterations"].as<int>();
        }
        if (chat["tool_timeout"]) {
            config.chat.tool_timeout_seconds = chat["tool_timeout"].as<int>();
        }
        if (chat["stream"]) {
            config.chat.stream = chat["stream"].as<bool>();
        }
    }

    // -- Connect --
    if (root["connect"]) {
        const auto& connect = root["connect"];
        if (connect["retry_attempts"]) {
            config.connect.retry_attempts = connect["retry_attempts"].as<int>();
        }
        if (connect["retry_delay"]) {
            config.connect.retry_delay_seconds = connect["retry_delay"].as<double>();
        }
        if (connect["fail_fast"]) {
            config.connect.fail_fast = connect["fail_fast"].as<bool>();
        }
    }

    // -- Servers --
    if (root["servers"]) {
        for (const auto& server_node : root["servers"]) {
            auto server_result = ParseYamlServer(server_node);
            if (server_result.IsErr()) {
                return Result<AppConfig, Error>::Err(std::move(server_result).Error());
            }
            config.servers.push_back(std::move(server_result).Value());
        }
    }

    // -- Options --
    if (root["history_file"]) {
        config.history_file = root["history_file"].as<std::string>();
    }
    if (root["log_file"]) {
        config.log_file = root["log_file"].as<std::string>();
    }
    if (root["log_level"]) {
        config.log_level = root["log_level"].as<std::string>();
    }
    if (root["json_logs"]) {
        config.json_logs = root["json_logs"].as<bool>();
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    try {
        YAML::Node root = YAML::LoadFile(std::string(file_path));
        return ParseYamlRoot(root).Map([file_path](AppConfig config) {
            config.config_path = std::string(file_path);
            return config;
        });
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what())));
    }
}

Result<AppConfig, Error> LoadFromYamlString(const std::string& yaml_text) {
    try {
        return ParseYamlRoot(YAML::Load(yaml_text));
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML: " + std::string(e.what())));
    }
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv) {
    argparse::ArgumentParser program("mcp-chat", kVersion,
                                     argparse::default_arguments::help);

    int verbosity = 0;

    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--model")
        .help("Model identifier");
    program.add_argument("--system-prompt")
        .help("System prompt for new conversations");
    program.add_argument("--max-iterations")
        .help("Maximum model calls per turn")
        .scan<'i', int>();
    program.add_argument("--history")
        .help("Conversation history file");
    program.add_argument("--no-stream")
        .help("Wait for complete responses instead of streaming")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--json-logs")
        .help("Write log lines as JSON")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--log-file")
        .help("Log file path");
    program.add_argument("-v", "--verbose")
        .help("Verbose output (repeat for debug)")
        .action([&](const auto&) { ++verbosity; })
        .append()
        .default_value(false)
        .implicit_value(true)
        .nargs(0);
    program.add_argument("message")
        .help("Send one message and exit")
        .nargs(argparse::nargs_pattern::optional);

    try {
        program.parse_args(argc, argv);
    } catch (const std::runtime_error& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    AppConfig config;

    if (auto val = program.present("--config")) {
        config.config_path = *val;
    }
    if (auto val = program.present("--model")) {
        config.model.name = *val;
    }
    if (auto val = program.present("--system-prompt")) {
        config.chat.system_prompt = *val;
    }
    if (auto val = program.present<int>("--max-iterations")) {
        config.chat.max_iterations = *val;
    }
    if (auto val = program.present("--history")) {
        config.history_file = *val;
    }
    if (program.get<bool>("--no-stream")) {
        config.chat.stream = false;
    }
    if (program.get<bool>("--json-logs")) {
        config.json_logs = true;
    }
    if (auto val = program.present("--log-file")) {
        config.log_file = *val;
    }
    if (auto val = program.present("message")) {
        config.message = *val;
    }
    config.verbosity = verbosity;

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides) {
    AppConfig merged = yaml_base;
    const AppConfig defaults;

    // Model overrides
    if (cli_overrides.model.name != defaults.model.name) {
        merged.model.name = cli_overrides.model.name;
    }

    // Chat overrides
    if (cli_overrides.chat.system_prompt.has_value()) {
        merged.chat.system_prompt = cli_overrides.chat.system_prompt;
    }
    if (cli_overrides.chat.max_iterations != defaults.chat.max_iterations) {
        merged.chat.max_iterations = cli_overrides.chat.max_iterations;
    }
    if (!cli_overrides.chat.stream) {
        merged.chat.stream = false;
    }

    // Options
    if (cli_overrides.config_path.has_value()) {
        merged.config_path = cli_overrides.config_path;
    }
    if (cli_overrides.history_file.has_value()) {
        merged.history_file = cli_overrides.history_file;
    }
    if (cli_overrides.log_file.has_value()) {
        merged.log_file = cli_overrides.log_file;
    }
    if (cli_overrides.json_logs) {
        merged.json_logs = true;
    }
    if (cli_overrides.verbosity > 0) {
        merged.verbosity = cli_overrides.verbosity;
        merged.log_level = cli_overrides.verbosity > 1 ? "debug" : "info";
    }
    if (cli_overrides.message.has_value()) {
        merged.message = cli_overrides.message;
    }

    return merged;
}

// ---------------------------------------------------------------------------
// ResolveApiKeyEnv
// ---------------------------------------------------------------------------
Result<AppConfig, Error> ResolveApiKeyEnv(AppConfig config) {
    if (config.model.api_key.empty() && !config.model.api_key_env.empty()) {
        const auto& env_var = config.model.api_key_env;
        const char* env_val = std::getenv(env_var.c_str());
        if (env_val == nullptr || *env_val == '\0') {
            return Result<AppConfig, Error>::Err(
                MakeConfigError("Environment variable '" + env_var +
                                "' not set (specified by api_key_env)"));
        }
        config.model.api_key = env_val;
        LogDebug("config", "API key read from " + env_var + ": " +
                               RedactSecret(config.model.api_key));
    }
    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    if (config.model.name.empty()) {
        return Result<void, Error>::Err(MakeConfigError("Missing required field: model.name"));
    }
    if (config.model.base_url.empty()) {
        return Result<void, Error>::Err(
            MakeConfigError("Missing required field: model.base_url"));
    }
    if (config.model.api_key.empty()) {
        return Result<void, Error>::Err(
            MakeConfigError("Missing required field: model.api_key or model.api_key_env"));
    }
    if (config.model.temperature < 0.0 || config.model.temperature > 2.0) {
        return Result<void, Error>::Err(
            MakeConfigError("Temperature must be between 0 and 2, got " +
                            std::to_string(config.model.temperature)));
    }
    if (config.chat.max_iterations <= 0) {
        return Result<void, Error>::Err(
            MakeConfigError("max_iterations must be positive, got " +
                            std::to_string(config.chat.max_iterations)));
    }
    if (config.chat.tool_timeout_seconds <= 0) {
        return Result<void, Error>::Err(
            MakeConfigError("tool_timeout must be positive, got " +
                            std::to_string(config.chat.tool_timeout_seconds)));
    }
    if (config.connect.retry_attempts < 0) {
        return Result<void, Error>::Err(
            MakeConfigError("retry_attempts must not be negative, got " +
                            std::to_string(config.connect.retry_attempts)));
    }
    if (config.connect.retry_delay_seconds < 0.0) {
        return Result<void, Error>::Err(
            MakeConfigError("retry_delay must not be negative"));
    }
    if (!ParseLogLevel(config.log_level).has_value()) {
        return Result<void, Error>::Err(
            MakeConfigError("Unknown log_level '" + config.log_level + "'"));
    }

    std::set<std::string> names;
    for (const auto& server : config.servers) {
        if (!names.insert(server.name).second) {
            return Result<void, Error>::Err(
                MakeConfigError("Duplicate server name: " + server.name));
        }
        auto valid = server.Validate();
        if (valid.IsErr()) {
            return valid;
        }
    }
    return Result<void, Error>::Ok();
}

} // namespace mcp_chat
