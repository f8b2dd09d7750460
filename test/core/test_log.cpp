#include <catch2/catch.hpp>

#include <fairway_graph/core/log.hpp>

#include "../mocks/capture_log_sink.hpp"

#include <algorithm>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace fairway_graph;
using fairway_graph::testing::CaptureSink;
using fairway_graph::testing::ScopedCaptureLogger;

// ===========================================================================
// ParseLogLevel
// ===========================================================================

TEST_CASE("ParseLogLevel: accepts known names case-insensitively", "[log]") {
    LogLevel level = LogLevel::Error;
    CHECK(ParseLogLevel("debug", level));
    CHECK(level == LogLevel::Debug);
    CHECK(ParseLogLevel("INFO", level));
    CHECK(level == LogLevel::Info);
    CHECK(ParseLogLevel("Warning", level));
    CHECK(level == LogLevel::Warn);
    CHECK(ParseLogLevel("error", level));
    CHECK(level == LogLevel::Error);
}

TEST_CASE("ParseLogLevel: rejects unknown names and leaves level untouched", "[log]") {
    LogLevel level = LogLevel::Warn;
    CHECK_FALSE(ParseLogLevel("verbose", level));
    CHECK(level == LogLevel::Warn);
}

// ===========================================================================
// ConsoleSink
// ===========================================================================

namespace {

// Redirects std::cerr into a string for the lifetime of the object.
class CerrCapture {
public:
    CerrCapture() : previous_(std::cerr.rdbuf(buffer_.rdbuf())) {}
    ~CerrCapture() { std::cerr.rdbuf(previous_); }

    CerrCapture(const CerrCapture&) = delete;
    CerrCapture& operator=(const CerrCapture&) = delete;

    std::string Text() const { return buffer_.str(); }

private:
    std::ostringstream buffer_;
    std::streambuf* previous_;
};

} // anonymous namespace

TEST_CASE("ConsoleSink: timestamped line with level and component on stderr", "[log]") {
    CerrCapture capture;
    ConsoleSink sink;

    sink.Write(LogLevel::Warn, "BorderStitcher", "no match for NL_1");

    auto line = capture.Text();
    CHECK(line.find("[WARN]") != std::string::npos);
    CHECK(line.find("[BorderStitcher]") != std::string::npos);
    CHECK(line.find("no match for NL_1") != std::string::npos);
    // ISO-8601 UTC timestamp first: YYYY-MM-DDTHH:MM:SS.mmmZ
    REQUIRE(line.size() > 24);
    CHECK(line[4] == '-');
    CHECK(line[10] == 'T');
    CHECK(line[23] == 'Z');
    CHECK(line.back() == '\n');
}

// ===========================================================================
// JsonSink
// ===========================================================================

TEST_CASE("JsonSink: writes valid JSON lines", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);

    sink.Write(LogLevel::Info, "GraphMerger", "combined");

    auto line = oss.str();
    CHECK(line.find("\"level\":\"INFO\"") != std::string::npos);
    CHECK(line.find("\"component\":\"GraphMerger\"") != std::string::npos);
    CHECK(line.find("\"message\":\"combined\"") != std::string::npos);
    CHECK(line.find("\"ts\":\"") != std::string::npos);
    REQUIRE(!line.empty());
    CHECK(line.back() == '\n');
}

TEST_CASE("JsonSink: each write produces one line", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);

    sink.Write(LogLevel::Debug, "a", "first");
    sink.Write(LogLevel::Warn, "b", "second");

    auto output = oss.str();
    CHECK(std::count(output.begin(), output.end(), '\n') == 2);
}

TEST_CASE("JsonSink: escapes special characters in message", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);

    sink.Write(LogLevel::Info, "esc", "line1\nline2\ttab \"quoted\" back\\slash");

    auto output = oss.str();
    CHECK(output.find("\\n") != std::string::npos);
    CHECK(output.find("\\t") != std::string::npos);
    CHECK(output.find("\\\"quoted\\\"") != std::string::npos);
    CHECK(output.find("back\\\\slash") != std::string::npos);
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

TEST_CASE("Logger: concurrent logging keeps every message", "[log]") {
    auto sink = std::make_unique<CaptureSink>();
    auto* sink_ptr = sink.get();
    Logger logger(std::move(sink), LogLevel::Debug);

    constexpr int kThreads = 8;
    constexpr int kMessagesPerThread = 100;

    std::vector<std::thread> threads;
    threads.reserve(kThreads);
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&logger, t]() {
            for (int i = 0; i < kMessagesPerThread; ++i) {
                logger.Info("thread-" + std::to_string(t), "msg-" + std::to_string(i));
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    CHECK(sink_ptr->messages.size() == kThreads * kMessagesPerThread);
}

// ===========================================================================
// Global logger
// ===========================================================================

TEST_CASE("Global logger: free functions reach the installed sink", "[log]") {
    ScopedCaptureLogger capture;

    LogInfo("SectionGraphBuilder", "built");
    LogWarn("SectionGraphBuilder", "skipped");

    const auto& sink = capture.Sink();
    REQUIRE(sink.messages.size() == 2);
    CHECK(sink.messages[0].component == "SectionGraphBuilder");
    CHECK(sink.Contains(LogLevel::Warn, "skipped"));
}
