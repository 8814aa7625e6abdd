//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_logging.cpp
// Purpose: Logger level parsing, filtering and log file output
//==========================================================================================================

#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>

#include "env/EnvVars.h"
#include "logging/Logger.h"

using namespace mcphost;

TEST(Logger, LevelFromString) {
    EXPECT_EQ(Logger::levelFromString("debug"), LogLevel::Debug);
    EXPECT_EQ(Logger::levelFromString("Warning"), LogLevel::Warn);
    EXPECT_EQ(Logger::levelFromString("ERROR"), LogLevel::Error);
    EXPECT_EQ(Logger::levelFromString("verbose"), LogLevel::Info);
    EXPECT_STREQ(Logger::levelName(LogLevel::Warn), "WARN");
}

TEST(Logger, FileReceivesFilteredPlainLines) {
    const auto path = std::filesystem::temp_directory_path() /
                      ("mcphost_log_" + std::to_string(::getpid()) + ".log");
    std::filesystem::remove(path);
    const LogLevel saved = Logger::logLevel();

    ASSERT_TRUE(Logger::setLogFile(path.string()));
    Logger::setColor(true);
    Logger::setLogLevel(LogLevel::Warn);
    EXPECT_FALSE(Logger::enabled(LogLevel::Info));
    LOG_INFO("hidden {}", 1);
    LOG_WARN("visible {} {}", "warn", 2);
    LOG_ERROR("bad placeholder {}");
    Logger::setLogLevel(saved);
    Logger::setColor(false);

    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    const std::string text = ss.str();
    EXPECT_EQ(text.find("hidden"), std::string::npos);
    EXPECT_NE(text.find("[WARN] test_logging.cpp:"), std::string::npos);
    EXPECT_NE(text.find("visible warn 2"), std::string::npos);
    EXPECT_NE(text.find("Format error"), std::string::npos);
    EXPECT_EQ(text.find("\033["), std::string::npos);
    EXPECT_FALSE(Logger::setLogFile("/nonexistent-dir/mcphost.log"));
    std::filesystem::remove(path);
}

TEST(EnvVars, PositiveIntParsing) {
    ::setenv("MCPHOST_TEST_INT", "250", 1);
    EXPECT_EQ(GetEnvPositiveIntOrDefault("MCPHOST_TEST_INT", 7), 250);
    ::setenv("MCPHOST_TEST_INT", "12ms", 1);
    EXPECT_EQ(GetEnvPositiveIntOrDefault("MCPHOST_TEST_INT", 7), 7);
    ::setenv("MCPHOST_TEST_INT", "-3", 1);
    EXPECT_EQ(GetEnvPositiveIntOrDefault("MCPHOST_TEST_INT", 7), 7);
    ::unsetenv("MCPHOST_TEST_INT");
    EXPECT_EQ(GetEnvPositiveIntOrDefault("MCPHOST_TEST_INT", 7), 7);
    EXPECT_EQ(GetEnvOrDefault(nullptr, "d"), "d");
}
