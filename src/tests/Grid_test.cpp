#include "ScriptedRandomSource.h"
#include "core/Grid.h"

#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>
#include <utility>

using namespace FallingSand;

namespace {

bool isBorder(const Grid& grid, uint32_t x, uint32_t y)
{
    return x == 0 || y == 0 || x == grid.getWidth() - 1 || y == grid.getHeight() - 1;
}

} // namespace

TEST(GridTest, ConstructionStampsBorderAndLeavesInteriorAir)
{
    const std::pair<uint32_t, uint32_t> sizes[] = { { 2, 2 }, { 3, 3 }, { 3, 7 }, { 17, 5 } };

    for (const auto& [width, height] : sizes) {
        Grid grid(width, height, makeRandomSource(1));
        for (uint32_t y = 0; y < height; ++y) {
            for (uint32_t x = 0; x < width; ++x) {
                const Element expected = isBorder(grid, x, y) ? Element::Indestructible : Element::Air;
                EXPECT_EQ(grid.get(x, y).element, expected)
                    << width << "x" << height << " at (" << x << ", " << y << ")";
            }
        }
    }
}

TEST(GridTest, ConstructionRejectsDimensionsBelowTwo)
{
    EXPECT_THROW(Grid(1, 5), std::invalid_argument);
    EXPECT_THROW(Grid(5, 1), std::invalid_argument);
    EXPECT_THROW(Grid(0, 0), std::invalid_argument);
}

TEST(GridTest, SetElementOnBorderIsNoop)
{
    Grid grid(6, 6, makeRandomSource(1));

    grid.setElement(0, 3, Element::Sand);
    grid.setElement(5, 5, Element::Water, true);
    grid.setElement(2, 0, Element::Air);

    EXPECT_EQ(grid.get(0, 3).element, Element::Indestructible);
    EXPECT_EQ(grid.get(5, 5).element, Element::Indestructible);
    EXPECT_FALSE(grid.get(5, 5).source);
    EXPECT_EQ(grid.get(2, 0).element, Element::Indestructible);
}

TEST(GridTest, SwapWithIndestructibleChangesNeitherCell)
{
    Grid grid(6, 6, makeRandomSource(1));
    grid.setElement(1, 1, Element::Sand);
    const Cell before = grid.get(1, 1);

    grid.swap(1, 1, 0, 1);
    grid.swap(1, 0, 1, 1);

    EXPECT_EQ(grid.get(1, 1), before);
    EXPECT_EQ(grid.get(0, 1).element, Element::Indestructible);
    EXPECT_EQ(grid.get(1, 0).element, Element::Indestructible);
}

TEST(GridTest, SwapExchangesCellsAndStampsParity)
{
    Grid grid(6, 6, makeRandomSource(1));
    grid.setElement(2, 2, Element::Sand);
    grid.setElement(2, 3, Element::Water);

    ASSERT_TRUE(grid.toggleVisitedState());
    grid.swap(2, 2, 2, 3);

    EXPECT_EQ(grid.get(2, 2).element, Element::Water);
    EXPECT_EQ(grid.get(2, 3).element, Element::Sand);
    EXPECT_TRUE(grid.get(2, 2).visited);
    EXPECT_TRUE(grid.get(2, 3).visited);
}

TEST(GridTest, SetElementResetsStrengthAndStampsParity)
{
    Grid grid(6, 6, makeRandomSource(1));
    grid.toggleVisitedState();

    grid.setElement(3, 3, Element::Iron);
    grid.getMut(3, 3).strength = 2;
    grid.setElement(3, 3, Element::Iron, true);

    const Cell& cell = grid.get(3, 3);
    EXPECT_EQ(cell.strength, getElementStrength(Element::Iron));
    EXPECT_TRUE(cell.visited);
    EXPECT_TRUE(cell.source);
}

TEST(GridTest, VariantIsDrawnOnlyForVariedElements)
{
    Grid grid(6, 6, std::make_unique<ScriptedRandomSource>(std::vector<uint32_t>{ 77, 91 }));

    grid.setElement(1, 1, Element::Water); // No variance, no draw.
    grid.setElement(2, 1, Element::Sand);

    EXPECT_EQ(grid.get(1, 1).variant, 0);
    EXPECT_EQ(grid.get(2, 1).variant, 77);
}

TEST(GridTest, ReduceStrengthDecrementsAboveOne)
{
    Grid grid(6, 6, makeRandomSource(1));
    grid.setElement(2, 2, Element::Sand);
    grid.getMut(2, 2).strength = 3;

    EXPECT_TRUE(grid.reduceStrength(2, 2));
    EXPECT_EQ(grid.get(2, 2).strength, 2);
    EXPECT_TRUE(grid.reduceStrength(2, 2));
    EXPECT_EQ(grid.get(2, 2).strength, 1);

    // At one or below nothing changes.
    EXPECT_FALSE(grid.reduceStrength(2, 2));
    EXPECT_EQ(grid.get(2, 2).strength, 1);

    grid.getMut(2, 2).strength = 0;
    EXPECT_FALSE(grid.reduceStrength(2, 2));
    EXPECT_EQ(grid.get(2, 2).strength, 0);
}

TEST(GridTest, ClearResetsInteriorOnly)
{
    Grid grid(8, 8, makeRandomSource(1));
    grid.setElement(1, 1, Element::Sand);
    grid.setElement(6, 6, Element::LavaSource, true);
    grid.setElement(3, 4, Element::Life);

    grid.clear();

    for (uint32_t y = 0; y < 8; ++y) {
        for (uint32_t x = 0; x < 8; ++x) {
            const Cell& cell = grid.get(x, y);
            if (isBorder(grid, x, y)) {
                EXPECT_EQ(cell.element, Element::Indestructible);
            }
            else {
                EXPECT_EQ(cell.element, Element::Air);
                EXPECT_FALSE(cell.source);
            }
        }
    }
}

TEST(GridTest, ClearCellAndSetVisited)
{
    Grid grid(6, 6, makeRandomSource(1));
    grid.setElement(2, 2, Element::Oil);
    grid.toggleVisitedState();

    grid.setVisited(2, 2);
    EXPECT_EQ(grid.get(2, 2).element, Element::Oil);
    EXPECT_TRUE(grid.get(2, 2).visited);

    grid.clearCell(2, 2);
    EXPECT_EQ(grid.get(2, 2).element, Element::Air);
}

TEST(GridTest, RandomNeighbourXPicksEitherSide)
{
    Grid grid(6, 6, std::make_unique<ScriptedRandomSource>(std::vector<uint32_t>{ 0, 1 }));

    EXPECT_EQ(grid.randomNeighbourX(3), 4u);
    EXPECT_EQ(grid.randomNeighbourX(3), 2u);
}

TEST(GridTest, ToggleVisitedStateFlipsParity)
{
    Grid grid(4, 4, makeRandomSource(1));

    EXPECT_FALSE(grid.isVisitedState());
    EXPECT_TRUE(grid.toggleVisitedState());
    EXPECT_TRUE(grid.isVisitedState());
    EXPECT_FALSE(grid.toggleVisitedState());
}

TEST(GridTest, LiveNeighboursCountFromSnapshot)
{
    Grid grid(8, 8, makeRandomSource(1));
    grid.setElement(2, 2, Element::Life);
    grid.setElement(3, 2, Element::Life);
    grid.setElement(4, 4, Element::Life);
    grid.captureLifeSnapshot();

    EXPECT_EQ(grid.countLiveNeighbours(3, 3), 3);
    EXPECT_EQ(grid.countLiveNeighbours(2, 2), 1);

    // Later edits are invisible until the next snapshot.
    grid.setElement(4, 2, Element::Life);
    EXPECT_EQ(grid.countLiveNeighbours(3, 3), 3);
    grid.captureLifeSnapshot();
    EXPECT_EQ(grid.countLiveNeighbours(3, 3), 4);
}

TEST(GridTest, IsInteriorExcludesBorder)
{
    Grid grid(5, 4, makeRandomSource(1));

    EXPECT_TRUE(grid.isInterior(1, 1));
    EXPECT_TRUE(grid.isInterior(3, 2));
    EXPECT_FALSE(grid.isInterior(0, 1));
    EXPECT_FALSE(grid.isInterior(4, 1));
    EXPECT_FALSE(grid.isInterior(1, 3));
    EXPECT_FALSE(grid.isInterior(-1, 2));
}
