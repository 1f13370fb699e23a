#pragma once

#include <iosfwd>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace bbox_minimizer {

enum class LogLevel {
    Debug,
    Info,
    Warn
};

[[nodiscard]] std::string_view to_string(LogLevel level);

// Logging context handed to the optimizer. There is no process-wide logger;
// components log through whatever instance they were constructed with.
class Logger {
public:
    virtual ~Logger() = default;

    [[nodiscard]] virtual bool enabled(LogLevel level) const = 0;

    virtual void log(LogLevel level, std::string_view component, std::string_view message) = 0;

    void debug(std::string_view component, std::string_view message) {
        if (enabled(LogLevel::Debug)) log(LogLevel::Debug, component, message);
    }

    void info(std::string_view component, std::string_view message) {
        if (enabled(LogLevel::Info)) log(LogLevel::Info, component, message);
    }

    void warn(std::string_view component, std::string_view message) {
        if (enabled(LogLevel::Warn)) log(LogLevel::Warn, component, message);
    }
};

using LoggerPtr = std::shared_ptr<Logger>;

// Discards everything
class NullLogger : public Logger {
public:
    [[nodiscard]] bool enabled(LogLevel) const override { return false; }
    void log(LogLevel, std::string_view, std::string_view) override {}
};

// Writes "[Component] message" lines to a stream. Warnings carry a level tag.
// Lines from concurrent optimizations are serialized.
class StreamLogger : public Logger {
public:
    explicit StreamLogger(std::ostream& out, LogLevel min_level = LogLevel::Info);

    [[nodiscard]] bool enabled(LogLevel level) const override {
        return static_cast<int>(level) >= static_cast<int>(min_level_);
    }

    void log(LogLevel level, std::string_view component, std::string_view message) override;

    void set_min_level(LogLevel level) { min_level_ = level; }
    [[nodiscard]] LogLevel min_level() const { return min_level_; }

private:
    std::ostream& out_;
    LogLevel min_level_;
    std::mutex mutex_;
};

// Shared no-op instance
[[nodiscard]] LoggerPtr null_logger();

// StreamLogger on std::cout
[[nodiscard]] LoggerPtr console_logger(LogLevel min_level = LogLevel::Info);

}  // namespace bbox_minimizer
