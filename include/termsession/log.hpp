#pragma once

#include <iosfwd>
#include <string>

namespace termsession {

enum class LogLevel { VERBOSE, INFO, WARNING, ERROR, OFF };

// Diagnostics go to std::cerr unless redirected. Passing nullptr silences them.
auto set_log_stream(std::ostream* stream) -> void;
auto set_log_level(LogLevel level) -> void;
auto log_level() -> LogLevel;

auto log_message(LogLevel level, const std::string& message) -> void;

inline auto log_verbose(const std::string& message) -> void { log_message(LogLevel::VERBOSE, message); }
inline auto log_info(const std::string& message) -> void { log_message(LogLevel::INFO, message); }
inline auto log_warning(const std::string& message) -> void { log_message(LogLevel::WARNING, message); }
inline auto log_error(const std::string& message) -> void { log_message(LogLevel::ERROR, message); }

} // namespace termsession
