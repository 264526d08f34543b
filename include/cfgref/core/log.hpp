#pragma once

#include <atomic>
#include <chrono>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace cfgref {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

// "debug", "info", "warn"/"warning", "error" (case-insensitive).
std::optional<LogLevel> ParseLogLevel(std::string_view name);

// Upper-case level name as written by the sinks ("DEBUG", "INFO", ...).
const char* LogLevelName(LogLevel level);

// One log event. The views are only valid for the duration of ILogSink::Write.
struct LogRecord {
    LogLevel level = LogLevel::Info;
    std::chrono::system_clock::time_point time;
    std::string_view component;
    std::string_view message;
};

// "<UTC timestamp> <LEVEL> <component>: <message>", without the newline.
std::string FormatLogLine(const LogRecord& record);

class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void Write(const LogRecord& record) = 0;
};

// Plain lines on stderr.
class ConsoleSink : public ILogSink {
public:
    void Write(const LogRecord& record) override;
};

// Compact colored lines for interactive terminals. Without color the output
// is the same as ConsoleSink.
class ColorConsoleSink : public ILogSink {
public:
    explicit ColorConsoleSink(bool use_color, std::ostream& out = std::cerr);
    void Write(const LogRecord& record) override;

private:
    bool use_color_;
    std::ostream& out_;
};

// JSON lines: {"time", "level", "component", "msg"}.
class JsonSink : public ILogSink {
public:
    explicit JsonSink(std::ostream& out);
    void Write(const LogRecord& record) override;

private:
    std::ostream& out_;
};

// Appends plain lines to a file, flushing after each one. Writes are dropped
// when the file could not be opened.
class FileSink : public ILogSink {
public:
    explicit FileSink(const std::string& path);
    [[nodiscard]] bool IsOpen() const { return out_.is_open(); }
    void Write(const LogRecord& record) override;

private:
    std::ofstream out_;
};

// Level filter in front of a sink. Writes are serialized; the level check
// is lock-free so hot paths can ask Enabled() before building a message.
class Logger {
public:
    explicit Logger(std::unique_ptr<ILogSink> sink,
                    LogLevel min_level = LogLevel::Info);

    // Swaps the sink and level. A null sink silences the logger.
    void Reset(std::unique_ptr<ILogSink> sink, LogLevel min_level);
    void SetLevel(LogLevel level);
    [[nodiscard]] bool Enabled(LogLevel level) const;

    void Log(LogLevel level, std::string_view component, std::string_view message);
    void Debug(std::string_view component, std::string_view message) {
        Log(LogLevel::Debug, component, message);
    }
    void Info(std::string_view component, std::string_view message) {
        Log(LogLevel::Info, component, message);
    }
    void Warn(std::string_view component, std::string_view message) {
        Log(LogLevel::Warn, component, message);
    }
    void Error(std::string_view component, std::string_view message) {
        Log(LogLevel::Error, component, message);
    }

private:
    std::unique_ptr<ILogSink> sink_;
    std::atomic<LogLevel> min_level_;
    std::mutex write_mutex_;
};

// Process-wide logger. Silent until InitGlobalLogger installs a sink;
// calling it again replaces the sink (main does so once the settings file
// is merged).
void InitGlobalLogger(std::unique_ptr<ILogSink> sink, LogLevel min_level);
Logger& GlobalLogger();

void LogDebug(std::string_view component, std::string_view message);
void LogInfo(std::string_view component, std::string_view message);
void LogWarn(std::string_view component, std::string_view message);
void LogError(std::string_view component, std::string_view message);

} // namespace cfgref
