#include "hierophant/log.hpp"

#include <atomic>
#include <iostream>

namespace hierophant {

namespace {

std::atomic<int> gLogLevel{static_cast<int>(LogLevel::Warn)};

bool enabled(LogLevel level) {
    return static_cast<int>(level) >= gLogLevel.load(std::memory_order_relaxed);
}

}  // namespace

void setLogLevel(LogLevel level) {
    gLogLevel.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel logLevel() {
    return static_cast<LogLevel>(gLogLevel.load(std::memory_order_relaxed));
}

// ============================================================================
// Logger
// ============================================================================

void Logger::debug(std::string_view message) const {
    if (!enabled(LogLevel::Debug)) return;
    std::cout << "[" << component_ << "] DEBUG: " << message << "\n";
}

void Logger::info(std::string_view message) const {
    if (!enabled(LogLevel::Info)) return;
    std::cout << "[" << component_ << "] " << message << "\n";
}

void Logger::warn(std::string_view message) const {
    if (!enabled(LogLevel::Warn)) return;
    std::cerr << "[" << component_ << "] WARNING: " << message << "\n";
}

void Logger::error(std::string_view message) const {
    if (!enabled(LogLevel::Error)) return;
    std::cerr << "[" << component_ << "] ERROR: " << message << "\n";
}

}  // namespace hierophant
