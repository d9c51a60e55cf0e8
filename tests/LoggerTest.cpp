/**
 * @file LoggerTest.cpp
 * @brief File sink, level filtering and verbosity helpers.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

#include "Logger.h"

namespace {

std::string readAll(const std::string& path) {
    std::ifstream in(path);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

} // namespace

TEST(LoggerTest, ParseLevelNames) {
    Logger::Level lvl = Logger::Level::Info;
    EXPECT_TRUE(Logger::parseLevel("DEBUG", lvl));
    EXPECT_EQ(lvl, Logger::Level::Debug);
    EXPECT_TRUE(Logger::parseLevel("warning", lvl));
    EXPECT_EQ(lvl, Logger::Level::Warn);
    EXPECT_TRUE(Logger::parseLevel("off", lvl));
    EXPECT_EQ(lvl, Logger::Level::None);
    EXPECT_FALSE(Logger::parseLevel("chatty", lvl));
    EXPECT_EQ(lvl, Logger::Level::None);
    EXPECT_STREQ(Logger::levelName(Logger::Level::Error), "ERROR");
}

TEST(LoggerTest, SilentBeforeInit) {
    EXPECT_FALSE(Logger::isInitialized());
    Logger::info("dropped");
    Logger::shutdown();
    EXPECT_FALSE(Logger::isInitialized());
}

TEST(LoggerTest, WritesFilteredLinesToFile) {
    const std::string path = ::testing::TempDir() + "golarcade_logger_test.log";
    std::remove(path.c_str());
    const Logger::Level saved = Logger::level();

    Logger::init(path);
    ASSERT_TRUE(Logger::isInitialized());
    Logger::setLevel(Logger::Level::Info);
    Logger::debug("hidden debug line");
    Logger::info("visible info line");
    logVerbose(Verbosity::Normal, "hidden verbose line");
    logWarning(Verbosity::Quiet, "hidden quiet warning");
    logWarning(Verbosity::Normal, "visible warning line");
    Logger::setLevel(Logger::Level::Debug);
    logVerbose(Verbosity::Verbose, "visible verbose line");
    Logger::logException("where", std::runtime_error("boom"));
    Logger::log(Logger::Level::Error, "visible direct line");
    Logger::shutdown();
    Logger::setLevel(saved);

    const std::string text = readAll(path);
    EXPECT_NE(text.find("session start"), std::string::npos);
    EXPECT_NE(text.find("[INFO]"), std::string::npos);
    EXPECT_NE(text.find("visible info line"), std::string::npos);
    EXPECT_NE(text.find("[WARN]"), std::string::npos);
    EXPECT_NE(text.find("visible warning line"), std::string::npos);
    EXPECT_NE(text.find("visible verbose line"), std::string::npos);
    EXPECT_NE(text.find("where: boom"), std::string::npos);
    EXPECT_NE(text.find("[ERROR]"), std::string::npos);
    EXPECT_NE(text.find("visible direct line"), std::string::npos);
    EXPECT_EQ(text.find("hidden"), std::string::npos);
    EXPECT_NE(text.find("session end"), std::string::npos);
    std::remove(path.c_str());
}
