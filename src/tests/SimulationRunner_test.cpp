#include "cli/SimulationRunner.h"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

using namespace FallingSand;
using namespace FallingSand::Client;

TEST(SimulationRunnerTest, RunsScenarioForRequestedSteps)
{
    spdlog::info("Starting SimulationRunnerTest::RunsScenarioForRequestedSteps test");
    SandboxConfig config;
    config.width = 32;
    config.height = 24;
    config.seed = 5;
    config.scenario = "sand_pile";

    SimulationRunner runner;
    auto result = runner.run(config, 25);
    ASSERT_TRUE(result.isValue()) << result.errorValue();

    const RunResults results = result.value();
    EXPECT_EQ(results.scenario, "sand_pile");
    EXPECT_EQ(results.steps, 25u);
    EXPECT_EQ(results.ticks, 25u);
    EXPECT_EQ(results.stats.width, 32u);
    EXPECT_GT(results.stats.count(Element::Sand), 0u);
    ASSERT_NE(runner.getWorld(), nullptr);
    EXPECT_EQ(runner.getWorld()->getState().ticks, 25u);
}

TEST(SimulationRunnerTest, PausedConfigStillSteps)
{
    SandboxConfig config;
    config.width = 16;
    config.height = 16;
    config.seed = 1;
    config.running = false;

    SimulationRunner runner;
    auto result = runner.run(config, 7);
    ASSERT_TRUE(result.isValue());
    EXPECT_EQ(result.value().ticks, 7u);
}

TEST(SimulationRunnerTest, RunsAreReproducibleWithSeed)
{
    SandboxConfig config;
    config.width = 40;
    config.height = 30;
    config.seed = 99;
    config.scenario = "volcano";

    SimulationRunner first;
    SimulationRunner second;
    ASSERT_TRUE(first.run(config, 80).isValue());
    ASSERT_TRUE(second.run(config, 80).isValue());

    EXPECT_TRUE(first.getWorld()->getGrid().getCells() == second.getWorld()->getGrid().getCells());
}

TEST(SimulationRunnerTest, ErrorsAreReported)
{
    SimulationRunner runner;

    SandboxConfig unknown;
    unknown.scenario = "nowhere";
    auto missing = runner.run(unknown, 1);
    ASSERT_TRUE(missing.isError());
    EXPECT_EQ(missing.errorValue(), "Unknown scenario 'nowhere'");

    SandboxConfig tiny;
    tiny.width = 1;
    EXPECT_TRUE(runner.run(tiny, 1).isError());

    // A wrapped "-1" from the command line must not reach the allocator.
    SandboxConfig huge;
    huge.width = 4294967295u;
    auto oversized = runner.run(huge, 1);
    ASSERT_TRUE(oversized.isError());
    EXPECT_NE(oversized.errorValue().find("at most 1024x1024"), std::string::npos);
    EXPECT_EQ(runner.getWorld(), nullptr);
}

TEST(SimulationRunnerTest, ResultsJsonSortsTimers)
{
    SandboxConfig config;
    config.width = 16;
    config.height = 16;
    config.seed = 2;

    SimulationRunner runner;
    auto result = runner.run(config, 3);
    ASSERT_TRUE(result.isValue());

    const nlohmann::json j = result.value();
    EXPECT_EQ(j["grid_size"], "16x16");
    EXPECT_EQ(j["ticks"], 3);
    ASSERT_TRUE(j["timer_stats"].is_array());
    ASSERT_EQ(j["timer_stats"].size(), 2u);
    EXPECT_GE(
        j["timer_stats"][0]["total_ms"].get<double>(), j["timer_stats"][1]["total_ms"].get<double>());
}
