#include "core/LoggingChannels.h"

#include <gtest/gtest.h>

using namespace FallingSand;

TEST(LoggingChannelsTest, UnknownChannelFallsBackToDefaultLogger)
{
    auto logger = LoggingChannels::get("no-such-channel");
    ASSERT_NE(logger, nullptr);
    EXPECT_EQ(logger, spdlog::default_logger());
}

TEST(LoggingChannelsTest, DefaultConfigListsEveryChannel)
{
    const nlohmann::json config = LoggingChannels::defaultConfig();

    ASSERT_TRUE(config.contains("channels"));
    for (const char* channel : { "sim", "grid", "rules", "tools", "scenario", "config" }) {
        EXPECT_EQ(config["channels"][channel], "info") << channel;
    }
    EXPECT_TRUE(config["sinks"]["console"]["enabled"].get<bool>());
    EXPECT_EQ(config["sinks"]["file"]["path"], "falling-sand.log");
}

TEST(LoggingChannelsTest, ConfigureFromStringSetsRegisteredLevels)
{
    auto logger = std::make_shared<spdlog::logger>("logging-test-channel");
    spdlog::register_logger(logger);

    LoggingChannels::configureFromString("logging-test-channel:trace");
    EXPECT_EQ(logger->level(), spdlog::level::trace);

    LoggingChannels::configureFromString(" logging-test-channel : warning ");
    EXPECT_EQ(logger->level(), spdlog::level::warn);

    LoggingChannels::configureFromString("missing-colon");
    EXPECT_EQ(logger->level(), spdlog::level::warn);

    spdlog::drop("logging-test-channel");
}
