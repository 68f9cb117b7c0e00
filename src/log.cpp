#include "termsession/log.hpp"
#include <atomic>
#include <iostream>
#include <mutex>

namespace termsession {

namespace {

std::mutex s_log_mutex;
std::ostream* s_log_stream = &std::cerr;
std::atomic<LogLevel> s_log_level{LogLevel::WARNING};

auto level_name(LogLevel level) -> const char* {
    switch (level) {
    case LogLevel::VERBOSE:
        return "Verbose";
    case LogLevel::INFO:
        return "Info";
    case LogLevel::WARNING:
        return "Warning";
    case LogLevel::ERROR:
        return "Error";
    case LogLevel::OFF:
        break;
    }
    return "";
}

} // namespace

auto set_log_stream(std::ostream* stream) -> void {
    std::lock_guard<std::mutex> lock(s_log_mutex);
    s_log_stream = stream;
}

auto set_log_level(LogLevel level) -> void { s_log_level.store(level); }

auto log_level() -> LogLevel { return s_log_level.load(); }

auto log_message(LogLevel level, const std::string& message) -> void {
    if (level == LogLevel::OFF || level < s_log_level.load()) {
        return;
    }

    std::lock_guard<std::mutex> lock(s_log_mutex);
    if (!s_log_stream) {
        return;
    }
    // Always \r\n, raw or not: raw mode disables output post-processing
    *s_log_stream << "[termsession] " << level_name(level) << ": " << message << "\r\n";
    s_log_stream->flush();
}

} // namespace termsession
