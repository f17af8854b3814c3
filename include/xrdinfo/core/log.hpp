#pragma once

#include <iostream>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <string_view>

namespace xrdinfo {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

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

// Null sink — discards everything.
class NullSink : public ILogSink {
public:
    void Write(LogLevel, std::string_view, std::string_view) override {}
};

// ---------------------------------------------------------------------------
// Logger — thread-safe dispatch to a sink.
//
// There is no process-wide logger. Callers build one and hand it to the
// components that should log (FetchOptions, MetadataClientOptions, ...);
// its level is the verbosity of everything that shares it.
// ---------------------------------------------------------------------------
class Logger {
public:
    explicit Logger(std::unique_ptr<ILogSink> sink,
                    LogLevel min_level = LogLevel::Info);

    void SetLevel(LogLevel level);
    [[nodiscard]] LogLevel Level() const;
    [[nodiscard]] bool Enabled(LogLevel level) const;

    void Debug(std::string_view component, std::string_view message);
    void Info(std::string_view component, std::string_view message);
    void Warn(std::string_view component, std::string_view message);
    void Error(std::string_view component, std::string_view message);

private:
    void Log(LogLevel level, std::string_view component,
             std::string_view message);

    std::unique_ptr<ILogSink> sink_;
    LogLevel min_level_;
    mutable std::mutex mutex_;
};

/// Logger that drops every message; used when a component gets no logger.
std::shared_ptr<Logger> MakeSilentLogger();

/// Returns logger unless it is null, in which case a silent logger.
std::shared_ptr<Logger> OrSilent(std::shared_ptr<Logger> logger);

} // namespace xrdinfo
