#include <gtest/gtest.h>

#include "core/registry/LogLevel.hpp"

using namespace pcr;

TEST(LogLevelTest, KnownNamesParse) {
  EXPECT_EQ(parseLogLevel("debug"), spdlog::level::debug);
  EXPECT_EQ(parseLogLevel("warn"), spdlog::level::warn);
  EXPECT_EQ(parseLogLevel("off"), spdlog::level::off);
}

TEST(LogLevelTest, TypoIsRejectedInsteadOfSilencingLogs) {
  EXPECT_FALSE(parseLogLevel("inf").has_value());
  EXPECT_FALSE(parseLogLevel("").has_value());
}
