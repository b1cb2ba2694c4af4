#include "core/SimulationStats.h"
#include "core/World.h"
#include "scenarios/ScenarioRegistry.h"

#include <gtest/gtest.h>
#include <spdlog/spdlog.h>

using namespace FallingSand;

namespace {

bool borderIntact(const Grid& grid)
{
    const uint32_t w = grid.getWidth();
    const uint32_t h = grid.getHeight();
    for (uint32_t x = 0; x < w; ++x) {
        if (!grid.get(x, 0).isIndestructible() || !grid.get(x, h - 1).isIndestructible()) {
            return false;
        }
    }
    for (uint32_t y = 0; y < h; ++y) {
        if (!grid.get(0, y).isIndestructible() || !grid.get(w - 1, y).isIndestructible()) {
            return false;
        }
    }
    return true;
}

} // namespace

TEST(WaterPuddleTest, SingleDropSettlesOnFloor)
{
    spdlog::info("Starting WaterPuddleTest::SingleDropSettlesOnFloor test");
    World world(64, 64, 42);
    const auto registry = ScenarioRegistry::createDefault();
    ASSERT_TRUE(registry.applyScenario("water_drop", world).isValue());
    ASSERT_EQ(world.getGrid().get(32, 1).element, Element::Water);

    for (int i = 0; i < 500; ++i) {
        world.advanceTick();
    }

    const Grid& grid = world.getGrid();
    const SimulationStats stats = computeStats(grid);
    EXPECT_EQ(stats.count(Element::Water), 1u);
    EXPECT_EQ(stats.occupiedCells, 1u);

    bool onFloor = false;
    for (uint32_t x = 1; x < 63; ++x) {
        if (grid.get(x, 62).element == Element::Water) {
            onFloor = true;
        }
    }
    EXPECT_TRUE(onFloor);
    EXPECT_TRUE(borderIntact(grid));
}

TEST(WaterPuddleTest, WaterVolumeIsConserved)
{
    World world(32, 32, 9);
    for (uint32_t y = 2; y < 12; ++y) {
        for (uint32_t x = 11; x < 21; ++x) {
            world.getGrid().setElement(x, y, Element::Water);
        }
    }

    for (int i = 0; i < 300; ++i) {
        world.advanceTick();
        ASSERT_EQ(computeStats(world.getGrid()).count(Element::Water), 100u) << "tick " << i + 1;
    }

    // Settled into the bottom rows.
    const Grid& grid = world.getGrid();
    uint32_t bottomRows = 0;
    for (uint32_t y = 24; y < 31; ++y) {
        for (uint32_t x = 1; x < 31; ++x) {
            if (grid.get(x, y).element == Element::Water) bottomRows++;
        }
    }
    EXPECT_GT(bottomRows, 50u);
    EXPECT_TRUE(borderIntact(grid));
}

TEST(WaterPuddleTest, SandSinksBelowWater)
{
    World world(16, 16, 3);
    Grid& grid = world.getGrid();
    for (uint32_t x = 1; x < 15; ++x) {
        grid.setElement(x, 14, Element::Water);
        grid.setElement(x, 13, Element::Water);
    }
    grid.setElement(7, 2, Element::Sand);

    for (int i = 0; i < 60; ++i) {
        world.advanceTick();
    }

    bool sandOnFloor = false;
    for (uint32_t x = 1; x < 15; ++x) {
        if (grid.get(x, 14).element == Element::Sand) sandOnFloor = true;
    }
    EXPECT_TRUE(sandOnFloor);
    EXPECT_EQ(computeStats(grid).count(Element::Water), 28u);
}
