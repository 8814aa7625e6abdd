//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.cpp
// Purpose: Logger sink state, level parsing and line formatting.
//==========================================================================================================

#include "logging/Logger.h"

#include <cctype>
#include <chrono>
#include <cstring>
#include <ctime>
#include <errno.h>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

#include "env/EnvVars.h"

namespace mcphost {

namespace {

bool envFlag(const char* name, const char* fallback) {
    const std::string v = GetEnvOrDefault(name, fallback);
    return v == "1" || v == "true" || v == "TRUE";
}

// Sink state lives behind one mutex; only the level is read without it.
struct Sink {
    std::mutex mutex;
    std::ofstream file;
    bool color = envFlag("MCPHOST_LOG_COLOR", "1");
    bool toStdout = envFlag("MCPHOST_LOG_STDOUT", "0");
};

Sink& sink() {
    static Sink s;
    return s;
}

const char* labelColor(LogLevel level) {
    switch (level) {
        case LogLevel::Error:
        case LogLevel::Fatal: return "\033[38;5;88m";
        case LogLevel::Warn: return "\033[33m";
        default: return "\033[35m";
    }
}

} // namespace

std::atomic<LogLevel> Logger::sLogLevel{Logger::levelFromString(GetEnvOrDefault("MCPHOST_LOG_LEVEL", "INFO"))};

LogLevel Logger::levelFromString(const std::string& lvl) {
    std::string s;
    s.reserve(lvl.size());
    for (char c : lvl) s.push_back(static_cast<char>(::toupper(static_cast<unsigned char>(c))));
    if (s == "DEBUG") return LogLevel::Debug;
    if (s == "WARN" || s == "WARNING") return LogLevel::Warn;
    if (s == "ERROR") return LogLevel::Error;
    if (s == "FATAL") return LogLevel::Fatal;
    return LogLevel::Info;
}

const char* Logger::levelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Fatal: return "FATAL";
    }
    return "INFO";
}

bool Logger::setLogFile(const std::string& filePath) {
    Sink& s = sink();
    std::lock_guard<std::mutex> lock(s.mutex);
    if (s.file.is_open()) {
        s.file.close();
    }
    s.file.open(filePath, std::ios::out | std::ios::app);
    if (!s.file.is_open()) {
        std::cerr << "[ERROR] Failed to open log file: " << filePath << " (errno=" << errno << ")" << std::endl;
        return false;
    }
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    ::localtime_r(&now, &tm);
    s.file << "\n=== mcphost log opened at " << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << " ===\n";
    s.file.flush();
    return true;
}

void Logger::setColor(bool on) {
    Sink& s = sink();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.color = on;
}

void Logger::setUseStdout(bool on) {
    Sink& s = sink();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.toStdout = on;
}

void Logger::ConfigureFromEnvironment() {
    const std::string lvl = GetEnvOrDefault("MCPHOST_LOG_LEVEL", "");
    if (!lvl.empty()) {
        setLogLevel(levelFromString(lvl));
    }
    setColor(envFlag("MCPHOST_LOG_COLOR", "1"));
    setUseStdout(envFlag("MCPHOST_LOG_STDOUT", "0"));
    const std::string file = GetEnvOrDefault("MCPHOST_LOG_FILE", "");
    if (!file.empty()) {
        setLogFile(file);
    }
}

void Logger::write(LogLevel level, const std::string& msg, const char* file, unsigned int line) {
    const char* base = ::strrchr(file, '/');
    base = base ? base + 1 : file;

    Sink& s = sink();
    std::lock_guard<std::mutex> lock(s.mutex);
    std::ostringstream plain;
    plain << "[" << levelName(level) << "] " << base << ":" << line << ": " << msg << "\n";

    std::ostream& console = s.toStdout ? std::cout : std::cerr;
    if (s.color) {
        console << "[" << labelColor(level) << levelName(level) << "\033[0m] " << base << ":" << line << ": "
                << msg << std::endl;
    } else {
        console << plain.str() << std::flush;
    }
    // The file never gets escape codes
    if (s.file.is_open()) {
        s.file << plain.str();
        s.file.flush();
    }
}

} // namespace mcphost
