//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.h
// Purpose: Process-wide logger with level filtering, optional log file and {fmt}-style placeholders.
//==========================================================================================================
#pragma once

#include <atomic>
#include <string>

#include <fmt/format.h>

namespace mcphost {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error,
    Fatal
};

//==========================================================================================================
// Logger
// Purpose: Static sink shared by the library, the CLI and the fixture server. Lines look like
//          "[LEVEL] File.cpp:123: message" and go to stderr unless routed to stdout.
// Environment:
//   MCPHOST_LOG_LEVEL  initial level (DEBUG, INFO, WARN, ERROR, FATAL); default INFO.
//   MCPHOST_LOG_FILE   appends every line to this file as well.
//   MCPHOST_LOG_COLOR  colorize the level label (default on).
//   MCPHOST_LOG_STDOUT write to stdout instead of stderr. Never set this in a stdio server.
//==========================================================================================================
class Logger {
public:
    // Case-insensitive; WARNING is accepted for WARN. Unknown strings map to Info.
    static LogLevel levelFromString(const std::string& lvl);
    static const char* levelName(LogLevel level);

    static void setLogLevel(LogLevel level) { sLogLevel.store(level, std::memory_order_relaxed); }
    static LogLevel logLevel() { return sLogLevel.load(std::memory_order_relaxed); }
    static bool enabled(LogLevel level) { return level >= logLevel(); }

    // Returns false when the file can not be opened; the previous file (if any) is closed either way.
    static bool setLogFile(const std::string& filePath);
    static void setColor(bool on);
    static void setUseStdout(bool on);

    // Re-reads the MCPHOST_LOG_* variables listed above.
    static void ConfigureFromEnvironment();

    template <typename... Args>
    static void logf(LogLevel level, const char* fmtStr, const char* file, unsigned int line, Args&&... args) {
        std::string buffer;
        try {
            buffer = fmt::vformat(fmtStr, fmt::make_format_args(args...));
        } catch (const fmt::format_error& e) {
            buffer = fmt::format("Format error: {} ({})", e.what(), fmtStr);
        }
        write(level, buffer, file, line);
    }

    static void write(LogLevel level, const std::string& msg, const char* file, unsigned int line);

private:
    static std::atomic<LogLevel> sLogLevel;
};

} // namespace mcphost

#define MCPHOST_LOG_AT(level, fmt, ...) \
    if (::mcphost::Logger::enabled(level)) ::mcphost::Logger::logf(level, fmt, __FILE__, __LINE__, ##__VA_ARGS__)

#define LOG_DEBUG(fmt, ...) MCPHOST_LOG_AT(::mcphost::LogLevel::Debug, fmt, ##__VA_ARGS__)
#define LOG_INFO(fmt, ...)  MCPHOST_LOG_AT(::mcphost::LogLevel::Info, fmt, ##__VA_ARGS__)
#define LOG_WARN(fmt, ...)  MCPHOST_LOG_AT(::mcphost::LogLevel::Warn, fmt, ##__VA_ARGS__)
#define LOG_ERROR(fmt, ...) MCPHOST_LOG_AT(::mcphost::LogLevel::Error, fmt, ##__VA_ARGS__)

#ifdef _DEBUG
namespace mcphost {
struct FuncScopeGuard {
    const char* func;
    explicit FuncScopeGuard(const char* f) : func(f) { LOG_DEBUG("ENTER: {}", func); }
    ~FuncScopeGuard() { LOG_DEBUG("EXIT:  {}", func); }
};
} // namespace mcphost
#define FUNC_SCOPE() [[maybe_unused]] ::mcphost::FuncScopeGuard funcScope(__FUNCTION__)
#else
#define FUNC_SCOPE() ((void)0)
#endif
