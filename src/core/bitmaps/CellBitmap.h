#pragma once

#include "Neighborhood3x3.h"

#include <cstdint>
#include <vector>

namespace FallingSand {

/**
 * Bit-packed grid for tracking one boolean property per cell.
 * Uses an 8×8 block representation, one uint64_t per block.
 *
 * Bit mapping within each block (row-major):
 *   Bit 0-7:   Row 0 (y=0), x increasing left to right
 *   Bit 8-15:  Row 1 (y=1)
 *   ...
 *   Bit 56-63: Row 7 (y=7)
 */
class CellBitmap {
private:
    uint32_t grid_width_;
    uint32_t grid_height_;
    uint32_t blocks_x_;
    uint32_t blocks_y_;
    std::vector<uint64_t> blocks_;

    static constexpr int BLOCK_SIZE = 8;

    inline void cellToBlockAndBit(uint32_t x, uint32_t y, uint32_t& block_idx, int& bit_idx) const;

public:
    CellBitmap(uint32_t width, uint32_t height);

    void set(uint32_t x, uint32_t y);
    void clear(uint32_t x, uint32_t y);
    bool isSet(uint32_t x, uint32_t y) const;

    // Reset every bit to zero.
    void clearAll();

    // True when no bit is set anywhere.
    bool isEmpty() const;

    Neighborhood3x3 getNeighborhood3x3(uint32_t x, uint32_t y) const;

    uint32_t getWidth() const { return grid_width_; }
    uint32_t getHeight() const { return grid_height_; }
};

} // namespace FallingSand
