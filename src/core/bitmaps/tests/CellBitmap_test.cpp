#include "core/bitmaps/CellBitmap.h"

#include <gtest/gtest.h>

using namespace FallingSand;

TEST(CellBitmapTest, ConstructionInitializesAllBitsToZero)
{
    CellBitmap bitmap(20, 12);

    for (uint32_t y = 0; y < 12; ++y) {
        for (uint32_t x = 0; x < 20; ++x) {
            EXPECT_FALSE(bitmap.isSet(x, y)) << "Bit at (" << x << ", " << y << ") should be zero";
        }
    }
    EXPECT_TRUE(bitmap.isEmpty());
}

TEST(CellBitmapTest, SetAndClearAreIndependentAcrossBlocks)
{
    CellBitmap bitmap(100, 100);

    // Block corners and a cell in a distant block.
    bitmap.set(0, 0);
    bitmap.set(7, 7);
    bitmap.set(8, 0);
    bitmap.set(50, 50);

    EXPECT_TRUE(bitmap.isSet(0, 0));
    EXPECT_TRUE(bitmap.isSet(7, 7));
    EXPECT_TRUE(bitmap.isSet(8, 0));
    EXPECT_TRUE(bitmap.isSet(50, 50));
    EXPECT_FALSE(bitmap.isSet(1, 0));
    EXPECT_FALSE(bitmap.isSet(9, 0));

    bitmap.clear(7, 7);
    EXPECT_FALSE(bitmap.isSet(7, 7));
    EXPECT_TRUE(bitmap.isSet(0, 0));
    EXPECT_FALSE(bitmap.isEmpty());
}

TEST(CellBitmapTest, PartialBlocksHoldBits)
{
    // 10x10 needs 2x2 blocks; the last row and column of blocks are partial.
    CellBitmap bitmap(10, 10);

    bitmap.set(9, 9);
    bitmap.set(8, 9);
    EXPECT_TRUE(bitmap.isSet(9, 9));
    EXPECT_TRUE(bitmap.isSet(8, 9));
}

TEST(CellBitmapTest, ClearAllEmptiesTheBitmap)
{
    CellBitmap bitmap(30, 30);
    bitmap.set(3, 4);
    bitmap.set(29, 29);
    ASSERT_FALSE(bitmap.isEmpty());

    bitmap.clearAll();

    EXPECT_TRUE(bitmap.isEmpty());
    EXPECT_FALSE(bitmap.isSet(3, 4));
    EXPECT_FALSE(bitmap.isSet(29, 29));
}

TEST(CellBitmapTest, NeighborhoodInsideOneBlockCountsNeighbours)
{
    CellBitmap bitmap(16, 16);

    // (3,3) is well inside block (0,0).
    bitmap.set(2, 2);
    bitmap.set(3, 2);
    bitmap.set(4, 4);
    bitmap.set(3, 3); // Centre, not counted.

    const Neighborhood3x3 n = bitmap.getNeighborhood3x3(3, 3);
    EXPECT_EQ(n.countSetNeighbours(), 3);
    EXPECT_TRUE(n.centre());
    EXPECT_TRUE(n.getAt(-1, -1));
    EXPECT_TRUE(n.getAt(0, -1));
    EXPECT_TRUE(n.getAt(1, 1));
    EXPECT_FALSE(n.getAt(1, -1));
    EXPECT_EQ(n.getValidLayer(), 0x1FF);
}

TEST(CellBitmapTest, NeighborhoodSpanningBlocksMatchesFastPath)
{
    CellBitmap bitmap(32, 32);

    // (8,8) sits on a block corner, so its window spans four blocks.
    bitmap.set(7, 7);
    bitmap.set(8, 7);
    bitmap.set(9, 9);

    const Neighborhood3x3 n = bitmap.getNeighborhood3x3(8, 8);
    EXPECT_EQ(n.countSetNeighbours(), 3);
    EXPECT_TRUE(n.getAt(-1, -1));
    EXPECT_TRUE(n.getAt(0, -1));
    EXPECT_TRUE(n.getAt(1, 1));
    EXPECT_FALSE(n.centre());
}

TEST(CellBitmapTest, NeighborhoodAtGridEdgeMarksOutOfBoundsInvalid)
{
    CellBitmap bitmap(10, 10);
    bitmap.set(1, 0);
    bitmap.set(0, 1);

    const Neighborhood3x3 n = bitmap.getNeighborhood3x3(0, 0);
    EXPECT_EQ(n.countSetNeighbours(), 2);
    EXPECT_FALSE(n.isValidAt(-1, -1));
    EXPECT_FALSE(n.isValidAt(0, -1));
    EXPECT_FALSE(n.isValidAt(-1, 0));
    EXPECT_TRUE(n.isValidAt(1, 1));
    EXPECT_TRUE(n.isValidAt(0, 0));
}

TEST(Neighborhood3x3Test, CoordinateAccessMatchesBitConstants)
{
    uint64_t data = 0;
    data |= (1 << Neighborhood3x3::N);
    data |= (1 << Neighborhood3x3::SE);
    data |= (0b111111111ULL << 9);

    Neighborhood3x3 n{ data };

    EXPECT_TRUE(n.getAt(0, -1));
    EXPECT_TRUE(n.getAt(1, 1));
    EXPECT_FALSE(n.getAt(-1, 1));
    EXPECT_EQ(n.getValueLayer(), (1 << Neighborhood3x3::N) | (1 << Neighborhood3x3::SE));
    EXPECT_EQ(n.countSetNeighbours(), 2);
}
