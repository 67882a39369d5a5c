#include <mcp_chat/chat/conversation_engine.hpp>
#include <mcp_chat/chat/conversation_store.hpp>
#include <mcp_chat/chat/openai_model.hpp>
#include <mcp_chat/chat/tool_catalog.hpp>
#include <mcp_chat/config/config_loader.hpp>
#include <mcp_chat/core/log.hpp>
#include <mcp_chat/core/version.hpp>
#include <mcp_chat/mcp/session_registry.hpp>
#include <mcp_chat/mcp/transport_connector.hpp>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>

#include <unistd.h>

namespace {

using namespace mcp_chat;

constexpr int kExitSuccess = 0;

// Check for --version before anything else is parsed.
bool HandleVersionFlag(int argc, const char* const* argv) {
    for (int i = 1; i < argc; ++i) {
        auto arg = std::string_view{argv[i]};
        if (arg == "--version") {
            std::cout << "mcp-chat " << kVersion << "\n";
            return true;
        }
        // Stop at the first positional argument (the message).
        if (!arg.empty() && arg[0] != '-') break;
    }
    return false;
}

bool NoColorEnvSet() {
    const char* value = std::getenv("NO_COLOR");
    return value != nullptr && *value != '\0';
}

bool IsStderrTty() {
    return isatty(STDERR_FILENO) != 0;
}

bool IsStdinTty() {
    return isatty(STDIN_FILENO) != 0;
}

void PrintError(const Error& error, bool json_output) {
    if (json_output) {
        std::cerr << error.ToJson() << "\n";
    } else {
        std::cerr << "Error: " << error.ToString() << "\n";
    }
}

void InitLogging(const AppConfig& config) {
    auto level = LogLevel::Warn;
    if (config.verbosity >= 2) {
        level = LogLevel::Debug;
    } else if (config.verbosity == 1) {
        level = LogLevel::Info;
    } else if (config.log_file.has_value()) {
        level = ParseLogLevel(config.log_level).value_or(LogLevel::Info);
    }

    std::unique_ptr<ILogSink> console;
    if (config.json_logs) {
        console = std::make_unique<JsonSink>(std::cerr);
    } else {
        console = std::make_unique<ColorConsoleSink>(!NoColorEnvSet() && IsStderrTty());
    }

    if (!config.log_file.has_value()) {
        InitGlobalLogger(std::move(console), level);
        return;
    }
    auto file = std::make_unique<FileSink>(*config.log_file);
    if (!file->IsOpen()) {
        InitGlobalLogger(std::move(console), level);
        LogWarn("config", "Cannot open log file " + *config.log_file);
        return;
    }
    if (config.verbosity > 0) {
        InitGlobalLogger(std::make_unique<TeeSink>(std::move(console), std::move(file)),
                         level);
    } else {
        InitGlobalLogger(std::move(file), level);
    }
}

// Steps 1-4: CLI, optional YAML, API key, validation.
Result<AppConfig, Error> LoadConfig(int argc, const char* const* argv) {
    auto cli_result = LoadFromCli(argc, argv);
    if (cli_result.IsErr()) {
        return cli_result;
    }
    auto cli_config = std::move(cli_result).Value();

    AppConfig config;
    if (cli_config.config_path.has_value()) {
        auto yaml_result = LoadFromYaml(*cli_config.config_path);
        if (yaml_result.IsErr()) {
            return yaml_result;
        }
        config = MergeConfigs(std::move(yaml_result).Value(), cli_config);
    } else {
        config = std::move(cli_config);
    }

    return ResolveApiKeyEnv(std::move(config)).AndThen([](AppConfig resolved) {
        auto valid = ValidateConfig(resolved);
        if (valid.IsErr()) {
            return Result<AppConfig, Error>::Err(std::move(valid).Error());
        }
        return Result<AppConfig, Error>::Ok(std::move(resolved));
    });
}

void PrintTools(const SessionRegistry& registry, std::ostream& out) {
    const auto catalog = ToolCatalog::Build(registry);
    if (catalog.Empty()) {
        out << "No tools available.\n";
        return;
    }
    for (const auto& [full_name, tool] : catalog.Entries()) {
        out << "  " << full_name << "  " << tool.description << "\n";
    }
}

void PrintServers(const SessionRegistry& registry, std::ostream& out) {
    const auto names = registry.ListServers();
    if (names.empty()) {
        out << "No servers connected.\n";
        return;
    }
    for (const auto& name : names) {
        auto info = registry.GetServerInfo(name);
        if (info.IsErr()) continue;
        const auto& s = info.Value();
        out << "  " << s.name << " (" << TransportKindName(s.transport) << ", "
            << s.tools.size() << " tools, up "
            << std::chrono::duration_cast<std::chrono::seconds>(s.uptime).count()
            << "s)\n";
    }
}

// Human-readable progress lines go to stderr so stdout carries only the
// assistant's answer.
bool PrintEvent(const ChatEvent& event) {
    std::visit([](const auto& e) {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, TokenEvent>) {
            std::cout << e.text << std::flush;
        } else if constexpr (std::is_same_v<T, ToolCallStartedEvent>) {
            std::cerr << "\n[tool] " << e.server_name << "/" << e.tool_name << " "
                      << e.arguments.dump(-1, ' ', false,
                                          nlohmann::json::error_handler_t::replace)
                      << "\n";
        } else if constexpr (std::is_same_v<T, ToolCallResultEvent>) {
            std::cerr << "[tool] " << e.server_name << "/" << e.tool_name
                      << (e.success ? " ok" : " failed: " + e.result) << "\n";
        } else if constexpr (std::is_same_v<T, DoneEvent>) {
            std::cout << "\n";
        }
    }, event);
    return true;
}

Result<std::string, Error> RunTurn(ConversationEngine& engine,
                                   const std::string& text,
                                   bool stream) {
    if (stream) {
        return engine.SendStreaming(text, PrintEvent);
    }
    auto reply = engine.Send(text);
    if (reply.IsOk()) {
        std::cout << reply.Value() << "\n";
    }
    return reply;
}

void Persist(ConversationEngine& engine, IConversationStore* store) {
    if (store == nullptr) return;
    auto saved = store->Append(engine.TakeUnpersisted());
    if (saved.IsErr()) {
        LogWarn("store", saved.Error().ToString());
    }
}

int RunRepl(ConversationEngine& engine, SessionRegistry& registry,
            IConversationStore* store, const AppConfig& config) {
    const bool interactive = IsStdinTty();
    if (interactive) {
        std::cout << "mcp-chat " << kVersion << " (" << config.model.name << ", "
                  << registry.Size() << " servers). /tools /servers /clear /quit\n";
    }

    std::string line;
    while (true) {
        if (interactive) std::cout << "> " << std::flush;
        if (!std::getline(std::cin, line)) break;
        if (line.empty()) continue;

        if (line == "/quit" || line == "/exit") break;
        if (line == "/tools") {
            PrintTools(registry, std::cout);
            continue;
        }
        if (line == "/servers") {
            PrintServers(registry, std::cout);
            continue;
        }
        if (line == "/clear") {
            engine.ClearHistory();
            if (store != nullptr) {
                auto cleared = store->Clear();
                if (cleared.IsErr()) LogWarn("store", cleared.Error().ToString());
            }
            std::cout << "History cleared.\n";
            continue;
        }

        auto reply = RunTurn(engine, line, config.chat.stream);
        Persist(engine, store);
        if (reply.IsErr()) {
            PrintError(reply.Error(), config.json_logs);
        }
    }
    return kExitSuccess;
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace mcp_chat;

    if (HandleVersionFlag(argc, argv)) {
        return kExitSuccess;
    }

    auto loaded = LoadConfig(argc, argv);
    if (loaded.IsErr()) {
        PrintError(loaded.Error(), false);
        return loaded.Error().ExitCode();
    }
    const auto config = std::move(loaded).Value();
    InitLogging(config);

    // Connect every configured server.
    TransportConnector connector;
    SessionRegistry registry(connector);
    RetryPolicy retry;
    retry.attempts = config.connect.retry_attempts;
    retry.delay = std::chrono::milliseconds(
        static_cast<long long>(config.connect.retry_delay_seconds * 1000.0));

    for (const auto& outcome :
         registry.AddMany(config.servers, config.connect.fail_fast, retry)) {
        if (outcome.result.IsErr()) {
            PrintError(outcome.result.Error(), config.json_logs);
            if (config.connect.fail_fast) {
                registry.CloseAll();
                return outcome.result.Error().ExitCode();
            }
        }
    }
    if (config.verbosity > 0) {
        std::cerr << "Tools:\n";
        PrintTools(registry, std::cerr);
    }

    OpenAiModelOptions model_options;
    model_options.base_url = config.model.base_url;
    model_options.api_key = config.model.api_key;
    model_options.model = config.model.name;
    model_options.temperature = config.model.temperature;
    auto model = OpenAiChatModel::Create(std::move(model_options));
    if (model.IsErr()) {
        PrintError(model.Error(), config.json_logs);
        registry.CloseAll();
        return model.Error().ExitCode();
    }
    auto chat_model = std::move(model).Value();

    // Resume the previous conversation, if any.
    std::unique_ptr<JsonFileConversationStore> store;
    std::vector<ConversationMessage> history;
    if (config.history_file.has_value()) {
        store = std::make_unique<JsonFileConversationStore>(*config.history_file);
        auto prior = store->Load();
        if (prior.IsErr()) {
            PrintError(prior.Error(), config.json_logs);
            registry.CloseAll();
            return prior.Error().ExitCode();
        }
        history = std::move(prior).Value();
        LogInfo("store", "Resumed " + std::to_string(history.size()) + " messages");
    }

    EngineOptions engine_options;
    engine_options.system_prompt = config.chat.system_prompt.value_or(kDefaultSystemPrompt);
    engine_options.max_iterations = config.chat.max_iterations;
    engine_options.tool_timeout = std::chrono::seconds(config.chat.tool_timeout_seconds);
    ConversationEngine engine(*chat_model, registry, engine_options, std::move(history));

    int exit_code = kExitSuccess;
    if (config.message.has_value()) {
        auto reply = RunTurn(engine, *config.message, config.chat.stream);
        Persist(engine, store.get());
        if (reply.IsErr()) {
            PrintError(reply.Error(), config.json_logs);
            exit_code = reply.Error().ExitCode();
        }
    } else {
        exit_code = RunRepl(engine, registry, store.get(), config);
    }

    registry.CloseAll();
    return exit_code;
}
