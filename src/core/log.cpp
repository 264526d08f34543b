#include <cfgref/core/log.hpp>
#include <cfgref/core/terminal.hpp>

#include <nlohmann/json.hpp>

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace cfgref {

namespace {

std::tm BrokenDown(std::chrono::system_clock::time_point time, bool utc) {
    const auto seconds = std::chrono::system_clock::to_time_t(time);
    std::tm out{};
#ifdef _WIN32
    if (utc) gmtime_s(&out, &seconds); else localtime_s(&out, &seconds);
#else
    if (utc) gmtime_r(&seconds, &out); else localtime_r(&seconds, &out);
#endif
    return out;
}

// 2026-10-17T09:14:03.512Z
std::string UtcTimestamp(std::chrono::system_clock::time_point time) {
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                            time.time_since_epoch()).count() % 1000;
    const auto tm = BrokenDown(time, true);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.'
        << std::setfill('0') << std::setw(3) << millis << 'Z';
    return oss.str();
}

std::string LocalClock(std::chrono::system_clock::time_point time) {
    const auto tm = BrokenDown(time, false);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%H:%M:%S");
    return oss.str();
}

const char* LevelColor(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return ansi::kDim;
        case LogLevel::Info:  return ansi::kCyan;
        case LogLevel::Warn:  return ansi::kYellow;
        case LogLevel::Error: return ansi::kRed;
    }
    return ansi::kReset;
}

} // anonymous namespace

std::optional<LogLevel> ParseLogLevel(std::string_view name) {
    std::string key;
    key.reserve(name.size());
    for (char c : name) {
        key.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (key == "debug") return LogLevel::Debug;
    if (key == "info") return LogLevel::Info;
    if (key == "warn" || key == "warning") return LogLevel::Warn;
    if (key == "error") return LogLevel::Error;
    return std::nullopt;
}

const char* LogLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "UNKNOWN";
}

std::string FormatLogLine(const LogRecord& record) {
    std::string line = UtcTimestamp(record.time);
    line += ' ';
    line += LogLevelName(record.level);
    line += ' ';
    line.append(record.component.data(), record.component.size());
    line += ": ";
    line.append(record.message.data(), record.message.size());
    return line;
}

void ConsoleSink::Write(const LogRecord& record) {
    std::cerr << FormatLogLine(record) << '\n';
}

ColorConsoleSink::ColorConsoleSink(bool use_color, std::ostream& out)
    : use_color_(use_color), out_(out) {}

void ColorConsoleSink::Write(const LogRecord& record) {
    if (!use_color_) {
        out_ << FormatLogLine(record) << '\n';
        return;
    }
    // 09:14:03 WARN  resolver: message
    const char* color = LevelColor(record.level);
    std::string tag = LogLevelName(record.level);
    tag.resize(5, ' ');
    out_ << ansi::kDim << LocalClock(record.time) << ansi::kReset << ' '
         << color << tag << ansi::kReset << ' '
         << ansi::kBold << record.component << ansi::kReset << ": ";
    if (record.level == LogLevel::Error) {
        out_ << color << record.message << ansi::kReset;
    } else {
        out_ << record.message;
    }
    out_ << '\n';
}

JsonSink::JsonSink(std::ostream& out) : out_(out) {}

void JsonSink::Write(const LogRecord& record) {
    nlohmann::ordered_json line = {
        {"time", UtcTimestamp(record.time)},
        {"level", LogLevelName(record.level)},
        {"component", std::string(record.component)},
        {"msg", std::string(record.message)},
    };
    out_ << line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
}

FileSink::FileSink(const std::string& path) : out_(path, std::ios::out | std::ios::app) {}

void FileSink::Write(const LogRecord& record) {
    if (!out_.is_open()) {
        return;
    }
    out_ << FormatLogLine(record) << std::endl;
}

Logger::Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level)
    : sink_(std::move(sink)), min_level_(min_level) {}

void Logger::Reset(std::unique_ptr<ILogSink> sink, LogLevel min_level) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    sink_ = std::move(sink);
    min_level_.store(min_level);
}

void Logger::SetLevel(LogLevel level) {
    min_level_.store(level);
}

bool Logger::Enabled(LogLevel level) const {
    return level >= min_level_.load();
}

void Logger::Log(LogLevel level, std::string_view component, std::string_view message) {
    if (!Enabled(level)) {
        return;
    }
    LogRecord record;
    record.level = level;
    record.time = std::chrono::system_clock::now();
    record.component = component;
    record.message = message;

    std::lock_guard<std::mutex> lock(write_mutex_);
    if (sink_) {
        sink_->Write(record);
    }
}

void InitGlobalLogger(std::unique_ptr<ILogSink> sink, LogLevel min_level) {
    GlobalLogger().Reset(std::move(sink), min_level);
}

Logger& GlobalLogger() {
    static Logger instance(nullptr, LogLevel::Error);
    return instance;
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

} // namespace cfgref
