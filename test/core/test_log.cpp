#include <catch2/catch_test_macros.hpp>

#include <cfgref/core/log.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace cfgref;

namespace {

struct Entry {
    LogLevel level;
    std::string component;
    std::string message;
};

// Copies each record, since the views die with the Write call.
class RecordingSink : public ILogSink {
public:
    explicit RecordingSink(std::vector<Entry>& entries) : entries_(entries) {}

    void Write(const LogRecord& record) override {
        entries_.push_back({record.level, std::string(record.component),
                            std::string(record.message)});
    }

private:
    std::vector<Entry>& entries_;
};

LogRecord MakeRecord(LogLevel level, std::string_view component, std::string_view message) {
    LogRecord record;
    record.level = level;
    // 2026-10-17T09:14:03.512Z
    record.time = std::chrono::system_clock::time_point(
        std::chrono::milliseconds(1792228443512LL));
    record.component = component;
    record.message = message;
    return record;
}

} // namespace

TEST_CASE("ParseLogLevel: names are case-insensitive, warning is an alias", "[log]") {
    CHECK(ParseLogLevel("DEBUG") == LogLevel::Debug);
    CHECK(ParseLogLevel("Info") == LogLevel::Info);
    CHECK(ParseLogLevel("warning") == LogLevel::Warn);
    CHECK(ParseLogLevel("WARN") == LogLevel::Warn);
    CHECK(ParseLogLevel("error") == LogLevel::Error);
    CHECK_FALSE(ParseLogLevel("").has_value());
    CHECK_FALSE(ParseLogLevel("trace").has_value());
}

TEST_CASE("FormatLogLine: UTC timestamp, level, component and message", "[log]") {
    auto line = FormatLogLine(
        MakeRecord(LogLevel::Warn, "resolver", "chain at deploy.url is 9 deep"));
    CHECK(line == "2026-10-17T09:14:03.512Z WARN resolver: chain at deploy.url is 9 deep");
}

TEST_CASE("JsonSink: one parseable object per record", "[log]") {
    std::ostringstream out;
    JsonSink sink(out);
    sink.Write(MakeRecord(LogLevel::Debug, "resolver", "service.image -> [service.slug]"));
    sink.Write(MakeRecord(LogLevel::Error, "cli", "quote \" and\nnewline"));

    std::istringstream lines(out.str());
    std::string first, second, extra;
    REQUIRE(std::getline(lines, first));
    REQUIRE(std::getline(lines, second));
    CHECK_FALSE(std::getline(lines, extra));

    auto a = nlohmann::json::parse(first);
    CHECK(a["time"] == "2026-10-17T09:14:03.512Z");
    CHECK(a["level"] == "DEBUG");
    CHECK(a["component"] == "resolver");
    CHECK(a["msg"] == "service.image -> [service.slug]");

    auto b = nlohmann::json::parse(second);
    CHECK(b["level"] == "ERROR");
    CHECK(b["msg"] == "quote \" and\nnewline");
}

TEST_CASE("ColorConsoleSink: without color writes the plain line", "[log]") {
    std::ostringstream out;
    ColorConsoleSink sink(false, out);
    auto record = MakeRecord(LogLevel::Info, "cli", "loaded service.yaml");
    sink.Write(record);
    CHECK(out.str() == FormatLogLine(record) + "\n");
}

TEST_CASE("ColorConsoleSink: with color tags the level and highlights errors", "[log]") {
    std::ostringstream warn_out;
    ColorConsoleSink(true, warn_out).Write(MakeRecord(LogLevel::Warn, "cli", "slow"));
    CHECK(warn_out.str().find("\033[33mWARN ") != std::string::npos);
    CHECK(warn_out.str().find("\033[1mcli\033[0m: slow\n") != std::string::npos);

    std::ostringstream error_out;
    ColorConsoleSink(true, error_out).Write(MakeRecord(LogLevel::Error, "cli", "boom"));
    CHECK(error_out.str().find("\033[1;31mERROR") != std::string::npos);
    CHECK(error_out.str().find("\033[1;31mboom\033[0m\n") != std::string::npos);
}

TEST_CASE("FileSink: appends across reopen", "[log]") {
    const auto path = (std::filesystem::temp_directory_path() / "cfgref_log_sink.log").string();
    std::remove(path.c_str());

    {
        FileSink sink(path);
        REQUIRE(sink.IsOpen());
        sink.Write(MakeRecord(LogLevel::Info, "cli", "first run"));
    }
    {
        FileSink sink(path);
        sink.Write(MakeRecord(LogLevel::Error, "cli", "second run"));
    }

    std::ifstream in(path);
    std::stringstream content;
    content << in.rdbuf();
    CHECK(content.str() ==
          "2026-10-17T09:14:03.512Z INFO cli: first run\n"
          "2026-10-17T09:14:03.512Z ERROR cli: second run\n");
    std::remove(path.c_str());
}

TEST_CASE("FileSink: a path in a missing directory is not opened", "[log]") {
    FileSink sink("/nonexistent-dir/cfgref/out.log");
    CHECK_FALSE(sink.IsOpen());
    sink.Write(MakeRecord(LogLevel::Error, "cli", "dropped"));
}

TEST_CASE("Logger: drops records below the minimum level", "[log]") {
    std::vector<Entry> entries;
    Logger logger(std::make_unique<RecordingSink>(entries), LogLevel::Info);

    logger.Debug("resolver", "edge a -> b");
    logger.Info("resolver", "resolved 2 references");
    logger.Error("cli", "document not found");

    REQUIRE(entries.size() == 2);
    CHECK(entries[0].level == LogLevel::Info);
    CHECK(entries[0].component == "resolver");
    CHECK(entries[0].message == "resolved 2 references");
    CHECK(entries[1].level == LogLevel::Error);
}

TEST_CASE("Logger: SetLevel and Enabled", "[log]") {
    std::vector<Entry> entries;
    Logger logger(std::make_unique<RecordingSink>(entries), LogLevel::Warn);
    CHECK_FALSE(logger.Enabled(LogLevel::Info));
    CHECK(logger.Enabled(LogLevel::Warn));

    logger.SetLevel(LogLevel::Debug);
    CHECK(logger.Enabled(LogLevel::Debug));
    logger.Debug("resolver", "now visible");
    CHECK(entries.size() == 1);
}

TEST_CASE("Logger: Reset swaps the sink, a null sink is silent", "[log]") {
    std::vector<Entry> before, after;
    Logger logger(std::make_unique<RecordingSink>(before), LogLevel::Info);
    logger.Info("cli", "one");

    logger.Reset(std::make_unique<RecordingSink>(after), LogLevel::Warn);
    logger.Info("cli", "filtered");
    logger.Warn("cli", "two");

    logger.Reset(nullptr, LogLevel::Debug);
    logger.Error("cli", "nowhere");

    CHECK(before.size() == 1);
    REQUIRE(after.size() == 1);
    CHECK(after[0].message == "two");
}

TEST_CASE("Logger: writes from many threads are all delivered", "[log]") {
    std::vector<Entry> entries;
    Logger logger(std::make_unique<RecordingSink>(entries), LogLevel::Debug);

    constexpr int kThreads = 6;
    constexpr int kPerThread = 150;
    std::vector<std::thread> workers;
    for (int t = 0; t < kThreads; ++t) {
        workers.emplace_back([&logger, t]() {
            for (int i = 0; i < kPerThread; ++i) {
                logger.Debug("worker-" + std::to_string(t), "node l" + std::to_string(i));
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    CHECK(entries.size() == static_cast<size_t>(kThreads * kPerThread));
    CHECK(std::count_if(entries.begin(), entries.end(), [](const Entry& e) {
              return e.component == "worker-0";
          }) == kPerThread);
}

TEST_CASE("GlobalLogger: free functions reach the installed sink", "[log]") {
    std::vector<Entry> entries;
    InitGlobalLogger(std::make_unique<RecordingSink>(entries), LogLevel::Warn);

    LogDebug("resolver", "hidden");
    LogInfo("resolver", "hidden");
    LogWarn("resolver", "unused value");
    LogError("cli", "exit 4");
    CHECK(GlobalLogger().Enabled(LogLevel::Warn));

    // Silence the global logger before entries goes out of scope.
    InitGlobalLogger(nullptr, LogLevel::Error);

    REQUIRE(entries.size() == 2);
    CHECK(entries[0].message == "unused value");
    CHECK(entries[1].component == "cli");
}
