#pragma once

#include <cstdint>

namespace FallingSand {

/**
 * 3×3 neighborhood extracted from CellBitmap.
 *
 * Packs 9 property values + 9 validity flags into uint64_t:
 *   Bits 0-8:   Property values (1 = true, e.g. held Life at tick start)
 *   Bits 9-17:  Validity flags (1 = in-bounds, 0 = OOB)
 *
 * Bit layout for 3×3 grid:
 *   NW N  NE     Bit positions:
 *   W  C  E      0  1  2
 *   SW S  SE     3  4  5
 *                6  7  8
 */
struct Neighborhood3x3 {
    uint64_t data;

    static constexpr int NW = 0, N = 1, NE = 2;
    static constexpr int W = 3, C = 4, E = 5;
    static constexpr int SW = 6, S = 7, SE = 8;

    uint16_t getValueLayer() const { return data & 0x1FF; }
    uint16_t getValidLayer() const { return (data >> 9) & 0x1FF; }

    // dx, dy in range [-1, 1].
    bool getAt(int dx, int dy) const
    {
        int bit_pos = (dy + 1) * 3 + (dx + 1);
        return (data >> bit_pos) & 1;
    }

    bool isValidAt(int dx, int dy) const
    {
        int bit_pos = (dy + 1) * 3 + (dx + 1);
        return (data >> (9 + bit_pos)) & 1;
    }

    bool centre() const { return (data >> C) & 1; }

    // Moore neighbours with the bit set, centre excluded.
    int countSetNeighbours() const
    {
        uint16_t values = getValueLayer();
        return __builtin_popcount(values & ~(1 << C));
    }
};

} // namespace FallingSand
