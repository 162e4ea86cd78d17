// Created by Carl Johan Gribel 2025.
// Licensed under the MIT License. See LICENSE file for details.

#include <gtest/gtest.h>
#include <memory>
#include <sstream>
#include "log/LogGlobals.hpp"
#include "log/LogMacros.h"
#include "log/LogManager.hpp"

using namespace rigtime;

TEST(LogManager, BuffersAndEchoes)
{
    std::ostringstream sink;
    LogManager logger(&sink);

    logger.log("%d bones, %s", 3, "ok");
    ASSERT_EQ(logger.lines().size(), 1u);
    EXPECT_EQ(logger.lines()[0].rfind("[+", 0), 0u);
    EXPECT_NE(logger.lines()[0].find("] 3 bones, ok"), std::string::npos);
    EXPECT_EQ(sink.str(), logger.lines()[0] + "\n");

    logger.clear();
    EXPECT_TRUE(logger.lines().empty());
}

TEST(LogManager, NullSinkOnlyBuffers)
{
    LogManager logger(nullptr);
    logger.log("first");
    logger.log("second first");
    EXPECT_EQ(logger.count_containing("first"), 2u);
    EXPECT_EQ(logger.count_containing("second"), 1u);
    EXPECT_EQ(logger.count_containing("third"), 0u);
}

TEST(LogGlobals, ForwardsWhileLoggerIsAlive)
{
    auto logger = std::make_shared<LogManager>(nullptr);
    LogGlobals::set_logger(logger);
    auto active = LogGlobals::try_get();
    EXPECT_EQ(active.get(), logger.get());

    RIGTIME_LOG("plain %d", 1);
    RIGTIME_LOG_INFO("info %d", 2);
    RIGTIME_LOG_WARN("warn");
    RIGTIME_LOG_ERROR("error %s", "three");

    EXPECT_EQ(logger->count_containing("] plain 1"), 1u);
    EXPECT_EQ(logger->count_containing("[INFO] info 2"), 1u);
    EXPECT_EQ(logger->count_containing("[WARN] warn"), 1u);
    EXPECT_EQ(logger->count_containing("[ERROR] error three"), 1u);

    LogGlobals::clear();
    EXPECT_TRUE(logger->lines().empty());

    // The locked pointer keeps the logger alive
    logger.reset();
    ASSERT_NE(LogGlobals::try_get(), nullptr);
    active->log("still alive");
    EXPECT_EQ(LogGlobals::try_get(), active);

    active.reset();
    EXPECT_EQ(LogGlobals::try_get(), nullptr);
    RIGTIME_LOG_INFO("dropped");
}
