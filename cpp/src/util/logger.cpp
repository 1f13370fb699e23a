#include "bbox_minimizer/util/logger.hpp"
#include <iostream>

namespace bbox_minimizer {

std::string_view to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warn: return "WARN";
    }
    return "INFO";
}

StreamLogger::StreamLogger(std::ostream& out, LogLevel min_level)
    : out_(out)
    , min_level_(min_level)
{}

void StreamLogger::log(LogLevel level, std::string_view component, std::string_view message) {
    if (!enabled(level)) return;

    std::lock_guard<std::mutex> lock(mutex_);
    out_ << "[" << component << "] ";
    if (level != LogLevel::Info) {
        out_ << to_string(level) << ": ";
    }
    out_ << message << "\n";
}

LoggerPtr null_logger() {
    static const LoggerPtr instance = std::make_shared<NullLogger>();
    return instance;
}

LoggerPtr console_logger(LogLevel min_level) {
    return std::make_shared<StreamLogger>(std::cout, min_level);
}

}  // namespace bbox_minimizer
