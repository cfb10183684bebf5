/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file logger.cpp
 * @brief Implementation of the diagnostic logger.
 */

#include "audex/infra/logger.hpp"

#include "audex/infra/string.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <stdexcept>

namespace audex::infra {

std::mutex Logger::mutex_;
std::atomic<LogLevel> Logger::threshold_{LogLevel::INFO};

void Logger::set_level(LogLevel level)
{
    threshold_.store(level);
}

LogLevel Logger::level()
{
    return threshold_.load();
}

LogLevel Logger::parse_level(const std::string& name)
{
    std::string n = String::to_lower(String::trim(name));
    if (n == "trace")
        return LogLevel::TRACE;
    if (n == "debug")
        return LogLevel::DEBUG;
    if (n == "info")
        return LogLevel::INFO;
    if (n == "warn" || n == "warning")
        return LogLevel::WARN;
    if (n == "error")
        return LogLevel::ERROR;
    if (n == "fatal")
        return LogLevel::FATAL;
    throw std::invalid_argument("Unknown log level: " + name);
}

/**
 * @brief Dispatches a formatted log line to the appropriate stream.
 *
 * Format: `[YYYY-MM-DD HH:MM:SS] [TAG] message`, with ANSI color per severity.
 */
void Logger::log(LogLevel level, const std::string& message)
{
    if (level < threshold_.load())
        return;

    std::lock_guard<std::mutex> lock(mutex_);

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);

    auto& stream = (level >= LogLevel::WARN) ? std::cerr : std::cout;

    // Mutex also protects std::localtime's static buffer.
    stream << "[" << std::put_time(std::localtime(&time), "%Y-%m-%d %H:%M:%S") << "] ";

    switch (level) {
    case LogLevel::TRACE:
        stream << "\033[90m[TRCE] ";
        break;
    case LogLevel::DEBUG:
        stream << "\033[36m[DBUG] ";
        break;
    case LogLevel::INFO:
        stream << "\033[32m[INFO] ";
        break;
    case LogLevel::WARN:
        stream << "\033[33m[WARN] ";
        break;
    case LogLevel::ERROR:
        stream << "\033[31m[FAIL] ";
        break;
    case LogLevel::FATAL:
        stream << "\033[1;31m[CRIT] ";
        break;
    }

    stream << message << "\033[0m" << std::endl;
}

} // namespace audex::infra
