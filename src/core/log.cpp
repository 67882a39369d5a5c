#include <mcp_chat/core/log.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace mcp_chat {

namespace {

namespace ansi {
constexpr const char* kReset  = "\033[0m";
constexpr const char* kDim    = "\033[90m";
constexpr const char* kRed    = "\033[1;31m";
constexpr const char* kYellow = "\033[33m";
constexpr const char* kCyan   = "\033[36m";
} // namespace ansi

const char* LevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "UNKNOWN";
}

std::string Iso8601Now() {
    const auto now = std::chrono::system_clock::now();
    const auto time_t_now = std::chrono::system_clock::to_time_t(now);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm utc{};
    gmtime_r(&time_t_now, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count()
        << 'Z';
    return oss.str();
}

// Escape a string for JSON output (handles \, ", and control characters).
void JsonEscape(std::ostream& out, std::string_view s) {
    for (char c : s) {
        switch (c) {
            case '"':  out << "\\\""; break;
            case '\\': out << "\\\\"; break;
            case '\n': out << "\\n";  break;
            case '\r': out << "\\r";  break;
            case '\t': out << "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out << "\\u"
                        << std::hex << std::setfill('0') << std::setw(4)
                        << static_cast<int>(static_cast<unsigned char>(c))
                        << std::dec;
                } else {
                    out << c;
                }
                break;
        }
    }
}

std::string HhMmSsNow() {
    const auto now = std::chrono::system_clock::now();
    const auto time_t_now = std::chrono::system_clock::to_time_t(now);

    std::tm local{};
    localtime_r(&time_t_now, &local);

    std::ostringstream oss;
    oss << std::put_time(&local, "%H:%M:%S");
    return oss.str();
}

const char* LevelAnsi(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return ansi::kDim;
        case LogLevel::Info:  return ansi::kCyan;
        case LogLevel::Warn:  return ansi::kYellow;
        case LogLevel::Error: return ansi::kRed;
    }
    return "";
}

// Fixed-width 5-char level tag (right-padded).
const char* LevelTag(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO ";
        case LogLevel::Warn:  return "WARN ";
        case LogLevel::Error: return "ERROR";
    }
    return "     ";
}

void WritePlainLine(std::ostream& out, LogLevel level,
                    std::string_view component, std::string_view message) {
    out << Iso8601Now()
        << " [" << LevelName(level) << "] "
        << "[" << component << "] "
        << message << '\n';
}

std::string ToLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

} // anonymous namespace

std::optional<LogLevel> ParseLogLevel(std::string_view text) {
    const auto lower = ToLower(text);
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error") return LogLevel::Error;
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// ConsoleSink
// ---------------------------------------------------------------------------
void ConsoleSink::Write(LogLevel level, std::string_view component,
                        std::string_view message) {
    WritePlainLine(std::cerr, level, component, message);
}

// ---------------------------------------------------------------------------
// ColorConsoleSink
// ---------------------------------------------------------------------------
ColorConsoleSink::ColorConsoleSink(bool use_color, std::ostream& out)
    : use_color_(use_color), out_(out) {}

void ColorConsoleSink::Write(LogLevel level, std::string_view component,
                             std::string_view message) {
    if (!use_color_) {
        WritePlainLine(out_, level, component, message);
        return;
    }

    // HH:MM:SS LEVEL [component] message
    const auto* level_color = LevelAnsi(level);
    out_ << ansi::kDim << HhMmSsNow() << ansi::kReset << ' ';
    out_ << level_color << LevelTag(level) << ansi::kReset << ' ';
    out_ << ansi::kDim << '[' << component << ']' << ansi::kReset << ' ';

    if (level == LogLevel::Error) {
        out_ << level_color << message << ansi::kReset;
    } else {
        out_ << message;
    }
    out_ << '\n';
}

// ---------------------------------------------------------------------------
// JsonSink
// ---------------------------------------------------------------------------
JsonSink::JsonSink(std::ostream& out) : out_(out) {}

void JsonSink::Write(LogLevel level, std::string_view component,
                     std::string_view message) {
    out_ << "{\"ts\":\"" << Iso8601Now()
         << "\",\"level\":\"" << LevelName(level)
         << "\",\"component\":\"";
    JsonEscape(out_, component);
    out_ << "\",\"message\":\"";
    JsonEscape(out_, message);
    out_ << "\"}\n";
}

// ---------------------------------------------------------------------------
// FileSink
// ---------------------------------------------------------------------------
FileSink::FileSink(const std::string& path)
    : out_(path, std::ios::out | std::ios::app) {}

void FileSink::Write(LogLevel level, std::string_view component,
                     std::string_view message) {
    if (!out_.is_open()) return;
    WritePlainLine(out_, level, component, message);
    out_.flush();
}

// ---------------------------------------------------------------------------
// TeeSink
// ---------------------------------------------------------------------------
TeeSink::TeeSink(std::unique_ptr<ILogSink> first,
                 std::unique_ptr<ILogSink> second)
    : first_(std::move(first)), second_(std::move(second)) {}

void TeeSink::Write(LogLevel level, std::string_view component,
                    std::string_view message) {
    if (first_) first_->Write(level, component, message);
    if (second_) second_->Write(level, component, message);
}

// ---------------------------------------------------------------------------
// Logger
// ---------------------------------------------------------------------------
Logger::Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level)
    : sink_(std::move(sink)), min_level_(min_level) {}

void Logger::SetLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

bool Logger::IsEnabled(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int>(level) >= static_cast<int>(min_level_);
}

void Logger::Debug(std::string_view component, std::string_view message) {
    Log(LogLevel::Debug, component, message);
}

void Logger::Info(std::string_view component, std::string_view message) {
    Log(LogLevel::Info, component, message);
}

void Logger::Warn(std::string_view component, std::string_view message) {
    Log(LogLevel::Warn, component, message);
}

void Logger::Error(std::string_view component, std::string_view message) {
    Log(LogLevel::Error, component, message);
}

void Logger::Log(LogLevel level, std::string_view component,
                 std::string_view message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (static_cast<int>(level) >= static_cast<int>(min_level_)) {
        sink_->Write(level, component, message);
    }
}

// ---------------------------------------------------------------------------
// NullSink — discards all messages (used before InitGlobalLogger is called).
// ---------------------------------------------------------------------------
namespace {

class NullSink : public ILogSink {
public:
    void Write(LogLevel, std::string_view, std::string_view) override {}
};

std::unique_ptr<Logger>& GlobalLoggerInstance() {
    static auto instance = std::make_unique<Logger>(
        std::make_unique<NullSink>(), LogLevel::Error);
    return instance;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Global logger
// ---------------------------------------------------------------------------
void InitGlobalLogger(std::unique_ptr<ILogSink> sink, LogLevel min_level) {
    GlobalLoggerInstance() = std::make_unique<Logger>(std::move(sink), min_level);
}

Logger& GlobalLogger() {
    return *GlobalLoggerInstance();
}

void LogDebug(std::string_view component, std::string_view message) {
    GlobalLogger().Debug(component, message);
}

void LogInfo(std::string_view component, std::string_view message) {
    GlobalLogger().Info(component, message);
}

void LogWarn(std::string_view component, std::string_view message) {
    GlobalLogger().Warn(component, message);
}

void LogError(std::string_view component, std::string_view message) {
    GlobalLogger().Error(component, message);
}

std::string RedactSecret(std::string_view secret) {
    if (secret.size() <= 8) return "***";
    return std::string(secret.substr(0, 4)) + "***";
}

bool IsSensitiveHeader(std::string_view name) {
    const auto lower = ToLower(name);
    return lower == "authorization" || lower == "proxy-authorization" ||
           lower == "cookie" || lower == "x-api-key" || lower == "api-key";
}

} // namespace mcp_chat
