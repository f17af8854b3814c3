#pragma once

#include <xrdinfo/core/log.hpp>

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace xrdinfo {
namespace testing {

struct CapturedMessage {
    LogLevel level;
    std::string component;
    std::string message;
};

// ---------------------------------------------------------------------------
// CaptureSink — records every message for later inspection.
//
// Usage:
//   auto [logger, sink] = MakeCaptureLogger();
//   ConfigurationFetcher fetcher(mock, FetchOptions{5s, logger});
//   ...
//   CHECK(sink->Count(LogLevel::Warn) == 1);
// ---------------------------------------------------------------------------
class CaptureSink : public ILogSink {
public:
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override {
        std::lock_guard<std::mutex> lock(mutex_);
        messages_.push_back({level, std::string(component), std::string(message)});
    }

    [[nodiscard]] std::vector<CapturedMessage> Messages() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return messages_;
    }

    [[nodiscard]] size_t Count(LogLevel level) const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (const auto& m : messages_) {
            if (m.level == level) {
                ++n;
            }
        }
        return n;
    }

    [[nodiscard]] bool Contains(std::string_view text) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& m : messages_) {
            if (m.message.find(text) != std::string::npos) {
                return true;
            }
        }
        return false;
    }

private:
    mutable std::mutex mutex_;
    std::vector<CapturedMessage> messages_;
};

struct CaptureLogger {
    std::shared_ptr<Logger> logger;
    CaptureSink* sink;
};

// A Debug-level logger whose sink stays owned by the logger.
inline CaptureLogger MakeCaptureLogger(LogLevel level = LogLevel::Debug) {
    auto sink = std::make_unique<CaptureSink>();
    auto* raw = sink.get();
    return {std::make_shared<Logger>(std::move(sink), level), raw};
}

} // namespace testing
} // namespace xrdinfo
