#pragma once

#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace mcp_chat {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

/// Parse "debug", "info", "warn"/"warning" or "error" (case-insensitive).
std::optional<LogLevel> ParseLogLevel(std::string_view text);

// Abstract log sink — implementations decide where/how to write.
class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void Write(LogLevel level, std::string_view component,
                       std::string_view message) = 0;
};

// Console sink — human-readable output to stderr.
class ConsoleSink : public ILogSink {
public:
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;
};

// Color console sink — colored, compact output to a stream.
// When use_color is false, falls back to the same format as ConsoleSink.
class ColorConsoleSink : public ILogSink {
public:
    explicit ColorConsoleSink(bool use_color, std::ostream& out = std::cerr);
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;
private:
    bool use_color_;
    std::ostream& out_;
};

// JSON sink — machine-readable JSON lines to a stream.
class JsonSink : public ILogSink {
public:
    explicit JsonSink(std::ostream& out);
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;
private:
    std::ostream& out_;
};

// File sink — plain lines appended to a log file. Keeps the chat output on
// stdout clean when the REPL is running.
class FileSink : public ILogSink {
public:
    explicit FileSink(const std::string& path);
    [[nodiscard]] bool IsOpen() const { return out_.is_open(); }
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;
private:
    std::ofstream out_;
};

// Fan-out sink — forwards every message to two sinks.
class TeeSink : public ILogSink {
public:
    TeeSink(std::unique_ptr<ILogSink> first, std::unique_ptr<ILogSink> second);
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;
private:
    std::unique_ptr<ILogSink> first_;
    std::unique_ptr<ILogSink> second_;
};

// Thread-safe logger that dispatches to a sink.
class Logger {
public:
    explicit Logger(std::unique_ptr<ILogSink> sink,
                    LogLevel min_level = LogLevel::Info);

    void SetLevel(LogLevel level);
    [[nodiscard]] bool IsEnabled(LogLevel level);

    void Debug(std::string_view component, std::string_view message);
    void Info(std::string_view component, std::string_view message);
    void Warn(std::string_view component, std::string_view message);
    void Error(std::string_view component, std::string_view message);

private:
    void Log(LogLevel level, std::string_view component,
             std::string_view message);

    std::unique_ptr<ILogSink> sink_;
    LogLevel min_level_;
    std::mutex mutex_;
};

// ---------------------------------------------------------------------------
// Global logger — set once at startup, used by all components.
// ---------------------------------------------------------------------------

/// Initialize the global logger. Must be called before any logging.
void InitGlobalLogger(std::unique_ptr<ILogSink> sink, LogLevel min_level);

/// Get the global logger. Returns a no-op logger if not initialized.
Logger& GlobalLogger();

/// Convenience free functions that forward to GlobalLogger().
void LogDebug(std::string_view component, std::string_view message);
void LogInfo(std::string_view component, std::string_view message);
void LogWarn(std::string_view component, std::string_view message);
void LogError(std::string_view component, std::string_view message);

/// Mask a secret for log output: keeps the first four characters.
/// "sk-or-v1-abcdef" -> "sk-o***"; short values become "***".
std::string RedactSecret(std::string_view secret);

/// True for header names whose values must never reach a log line
/// (Authorization, Cookie, X-Api-Key, ...). Case-insensitive.
bool IsSensitiveHeader(std::string_view name);

} // namespace mcp_chat
