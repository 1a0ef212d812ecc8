#include <catch2/catch_test_macros.hpp>

#include <simplest_mcp/core/log.hpp>

#include <algorithm>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace simplest_mcp;

namespace {

struct CapturedMessage {
    LogLevel level;
    std::string component;
    std::string message;
};

class CaptureSink : public ILogSink {
public:
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override {
        messages.push_back(
            {level, std::string(component), std::string(message)});
    }

    std::vector<CapturedMessage> messages;
};

} // anonymous namespace

// ===========================================================================
// ConsoleSink
// ===========================================================================

TEST_CASE("ConsoleSink: plain format carries level and component", "[log]") {
    std::ostringstream oss;
    ConsoleSink sink(false, oss);

    sink.Write(LogLevel::Warn, "mcp", "Method not found: foo");

    auto line = oss.str();
    CHECK(line.find("[WARN] [mcp] Method not found: foo") != std::string::npos);
    CHECK(line.find('\033') == std::string::npos);
    CHECK(line.back() == '\n');
}

TEST_CASE("ConsoleSink: color format uses ANSI escapes", "[log]") {
    std::ostringstream oss;
    ConsoleSink sink(true, oss);

    sink.Write(LogLevel::Error, "http", "bind failed");

    auto line = oss.str();
    CHECK(line.find('\033') != std::string::npos);
    CHECK(line.find("[http]") != std::string::npos);
    CHECK(line.find("bind failed") != std::string::npos);
}

// ===========================================================================
// JsonSink
// ===========================================================================

TEST_CASE("JsonSink: writes one JSON object per line", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);

    sink.Write(LogLevel::Info, "main", "started");
    sink.Write(LogLevel::Debug, "tools", "Somar -> 5");

    auto output = oss.str();
    CHECK(std::count(output.begin(), output.end(), '\n') == 2);
    CHECK(output.find("\"level\":\"INFO\"") != std::string::npos);
    CHECK(output.find("\"component\":\"main\"") != std::string::npos);
    CHECK(output.find("\"message\":\"started\"") != std::string::npos);
    CHECK(output.find("\"ts\":\"") != std::string::npos);
}

TEST_CASE("JsonSink: escapes quotes and control characters", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);

    sink.Write(LogLevel::Info, "esc", "a\nb \"q\" c\\d");

    auto output = oss.str();
    CHECK(output.find("a\\nb") != std::string::npos);
    CHECK(output.find("\\\"q\\\"") != std::string::npos);
    CHECK(output.find("c\\\\d") != std::string::npos);
}

// ===========================================================================
// Logger
// ===========================================================================

TEST_CASE("Logger: respects min_level", "[log]") {
    auto sink = std::make_unique<CaptureSink>();
    auto* sink_ptr = sink.get();
    Logger logger(std::move(sink), LogLevel::Warn);

    logger.Debug("c", "filtered");
    logger.Info("c", "filtered");
    logger.Warn("c", "passes");
    logger.Error("c", "passes");

    REQUIRE(sink_ptr->messages.size() == 2);
    CHECK(sink_ptr->messages[0].level == LogLevel::Warn);
    CHECK(sink_ptr->messages[1].level == LogLevel::Error);
}

TEST_CASE("Logger: SetLevel changes filtering", "[log]") {
    auto sink = std::make_unique<CaptureSink>();
    auto* sink_ptr = sink.get();
    Logger logger(std::move(sink), LogLevel::Error);

    logger.Info("c", "filtered");
    CHECK(sink_ptr->messages.empty());

    logger.SetLevel(LogLevel::Info);
    logger.Info("c", "now passes");
    REQUIRE(sink_ptr->messages.size() == 1);
    CHECK(sink_ptr->messages[0].component == "c");
    CHECK(sink_ptr->messages[0].message == "now passes");
}

TEST_CASE("Logger: concurrent writers lose no messages", "[log]") {
    auto sink = std::make_unique<CaptureSink>();
    auto* sink_ptr = sink.get();
    Logger logger(std::move(sink), LogLevel::Debug);

    constexpr int kThreads = 8;
    constexpr int kMessagesPerThread = 50;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&logger]() {
            for (int i = 0; i < kMessagesPerThread; ++i) {
                logger.Info("worker", "request handled");
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    CHECK(sink_ptr->messages.size() ==
          static_cast<size_t>(kThreads * kMessagesPerThread));
}

// ===========================================================================
// ParseLogLevel
// ===========================================================================

TEST_CASE("ParseLogLevel: accepts known names in any case", "[log]") {
    LogLevel level = LogLevel::Error;
    CHECK(ParseLogLevel("debug", level));
    CHECK(level == LogLevel::Debug);
    CHECK(ParseLogLevel("WARN", level));
    CHECK(level == LogLevel::Warn);
    CHECK(ParseLogLevel("Info", level));
    CHECK(level == LogLevel::Info);
}

TEST_CASE("ParseLogLevel: rejects unknown names", "[log]") {
    LogLevel level = LogLevel::Info;
    CHECK_FALSE(ParseLogLevel("verbose", level));
    CHECK(level == LogLevel::Info);
}
