/**
 * @file log.hpp
 * @brief Component-prefixed console logging
 *
 * Messages are written as "[Component] text". Informational output goes to
 * stdout, warnings and errors to stderr. A process-wide threshold filters
 * everything below it; the default keeps library use quiet apart from
 * warnings and errors.
 */

#pragma once

#include <string>
#include <string_view>

namespace hierophant {

enum class LogLevel : int {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
    Silent = 4,
};

/// Set the global threshold (messages below it are dropped)
void setLogLevel(LogLevel level);

/// Current global threshold
[[nodiscard]] LogLevel logLevel();

class Logger {
public:
    explicit Logger(std::string_view component) : component_(component) {}

    void debug(std::string_view message) const;
    void info(std::string_view message) const;
    void warn(std::string_view message) const;
    void error(std::string_view message) const;

    [[nodiscard]] const std::string& component() const { return component_; }

private:
    std::string component_;
};

}  // namespace hierophant
