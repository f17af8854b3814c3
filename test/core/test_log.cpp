#include <catch2/catch_test_macros.hpp>

#include <xrdinfo/core/log.hpp>

#include "../mocks/capture_sink.hpp"

#include <algorithm>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace xrdinfo;
using xrdinfo::testing::MakeCaptureLogger;

// ===========================================================================
// JsonSink
// ===========================================================================

TEST_CASE("JsonSink: writes one JSON object per line", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);

    sink.Write(LogLevel::Warn, "fetch", "source failed");
    sink.Write(LogLevel::Info, "fetch", "configuration fetched");

    auto output = oss.str();
    CHECK(std::count(output.begin(), output.end(), '\n') == 2);
    CHECK(output.find("\"level\":\"WARN\"") != std::string::npos);
    CHECK(output.find("\"component\":\"fetch\"") != std::string::npos);
    CHECK(output.find("\"message\":\"configuration fetched\"") != std::string::npos);
    CHECK(output.find("\"ts\":\"") != std::string::npos);
}

TEST_CASE("JsonSink: escapes quotes and control characters", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);

    sink.Write(LogLevel::Error, "meta", "fault \"Unknown service\"\n\tat C:\\gw");

    auto output = oss.str();
    CHECK(output.find("fault \\\"Unknown service\\\"\\n\\tat C:\\\\gw") != std::string::npos);
}

// ===========================================================================
// ColorConsoleSink
// ===========================================================================

TEST_CASE("ColorConsoleSink: plain mode has no escape codes", "[log]") {
    std::ostringstream oss;
    ColorConsoleSink sink(false, oss);

    sink.Write(LogLevel::Info, "http", "GET http://cs.example.org/internalconf");

    auto output = oss.str();
    CHECK(output.find("[INFO]") != std::string::npos);
    CHECK(output.find("[http]") != std::string::npos);
    CHECK(output.find("GET http://cs.example.org/internalconf") != std::string::npos);
    CHECK(output.find("\033[") == std::string::npos);
}

TEST_CASE("ColorConsoleSink: color mode marks errors red", "[log]") {
    std::ostringstream oss;
    ColorConsoleSink sink(true, oss);

    sink.Write(LogLevel::Error, "trust", "signature verification failed");

    auto output = oss.str();
    CHECK(output.find("\033[1;31m") != std::string::npos);
    CHECK(output.find("signature verification failed") != std::string::npos);
}

// ===========================================================================
// Logger
// ===========================================================================

TEST_CASE("Logger: drops messages below its level", "[log]") {
    auto [logger, sink] = MakeCaptureLogger(LogLevel::Warn);

    logger->Debug("c", "filtered");
    logger->Info("c", "filtered");
    logger->Warn("c", "kept");
    logger->Error("c", "kept");

    auto messages = sink->Messages();
    REQUIRE(messages.size() == 2);
    CHECK(messages[0].level == LogLevel::Warn);
    CHECK(messages[1].level == LogLevel::Error);
}

TEST_CASE("Logger: SetLevel changes filtering", "[log]") {
    auto [logger, sink] = MakeCaptureLogger(LogLevel::Error);

    logger->Info("c", "filtered");
    CHECK(sink->Messages().empty());
    CHECK_FALSE(logger->Enabled(LogLevel::Info));

    logger->SetLevel(LogLevel::Info);
    CHECK(logger->Level() == LogLevel::Info);
    logger->Info("conf", "now passes");

    auto messages = sink->Messages();
    REQUIRE(messages.size() == 1);
    CHECK(messages[0].component == "conf");
    CHECK(messages[0].message == "now passes");
}

TEST_CASE("Logger: concurrent callers share one logger", "[log]") {
    auto [logger, sink] = MakeCaptureLogger();

    constexpr int kThreads = 8;
    constexpr int kMessagesPerThread = 50;

    std::vector<std::thread> threads;
    threads.reserve(kThreads);
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([logger = logger, t]() {
            for (int i = 0; i < kMessagesPerThread; ++i) {
                logger->Info("worker-" + std::to_string(t), "msg-" + std::to_string(i));
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    CHECK(sink->Messages().size() == kThreads * kMessagesPerThread);
}

TEST_CASE("OrSilent: keeps a logger and replaces null", "[log]") {
    auto [logger, sink] = MakeCaptureLogger();
    CHECK(OrSilent(logger) == logger);

    auto silent = OrSilent(nullptr);
    REQUIRE(silent != nullptr);
    silent->Error("c", "goes nowhere");
    CHECK(sink->Messages().empty());
}
