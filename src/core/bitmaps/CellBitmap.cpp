#include "CellBitmap.h"

#include <algorithm>

namespace FallingSand {

CellBitmap::CellBitmap(uint32_t width, uint32_t height) : grid_width_(width), grid_height_(height)
{
    // Round up for partial blocks.
    blocks_x_ = (width + BLOCK_SIZE - 1) / BLOCK_SIZE;
    blocks_y_ = (height + BLOCK_SIZE - 1) / BLOCK_SIZE;

    blocks_.resize(blocks_x_ * blocks_y_, 0);
}

inline void CellBitmap::cellToBlockAndBit(
    uint32_t x, uint32_t y, uint32_t& block_idx, int& bit_idx) const
{
    uint32_t block_x = x >> 3;
    uint32_t block_y = y >> 3;
    block_idx = block_y * blocks_x_ + block_x;

    int local_x = x & 7;
    int local_y = y & 7;
    bit_idx = (local_y << 3) | local_x;
}

void CellBitmap::set(uint32_t x, uint32_t y)
{
    uint32_t block_idx;
    int bit_idx;
    cellToBlockAndBit(x, y, block_idx, bit_idx);
    blocks_[block_idx] |= (1ULL << bit_idx);
}

void CellBitmap::clear(uint32_t x, uint32_t y)
{
    uint32_t block_idx;
    int bit_idx;
    cellToBlockAndBit(x, y, block_idx, bit_idx);
    blocks_[block_idx] &= ~(1ULL << bit_idx);
}

bool CellBitmap::isSet(uint32_t x, uint32_t y) const
{
    uint32_t block_idx;
    int bit_idx;
    cellToBlockAndBit(x, y, block_idx, bit_idx);
    return (blocks_[block_idx] >> bit_idx) & 1;
}

void CellBitmap::clearAll()
{
    std::fill(blocks_.begin(), blocks_.end(), 0);
}

bool CellBitmap::isEmpty() const
{
    return std::all_of(blocks_.begin(), blocks_.end(), [](uint64_t block) { return block == 0; });
}

Neighborhood3x3 CellBitmap::getNeighborhood3x3(uint32_t x, uint32_t y) const
{
    uint32_t block_x = x >> 3;
    uint32_t block_y = y >> 3;
    int local_x = x & 7;
    int local_y = y & 7;

    // Fast path: the 3×3 window sits inside one block.
    if (local_x >= 1 && local_x <= 6 && local_y >= 1 && local_y <= 6) {
        uint64_t block = blocks_[block_y * blocks_x_ + block_x];
        int base_bit = ((local_y - 1) << 3) | (local_x - 1);

        uint64_t row0 = (block >> base_bit) & 0b111;
        uint64_t row1 = (block >> (base_bit + 8)) & 0b111;
        uint64_t row2 = (block >> (base_bit + 16)) & 0b111;

        uint64_t value_layer = row0 | (row1 << 3) | (row2 << 6);
        uint64_t valid_layer = 0x1FFULL;
        return Neighborhood3x3{ value_layer | (valid_layer << 9) };
    }

    // Slow path: the window spans blocks or leaves the grid.
    uint64_t result = 0;
    for (int dy = -1; dy <= 1; ++dy) {
        for (int dx = -1; dx <= 1; ++dx) {
            int bit_pos = (dy + 1) * 3 + (dx + 1);
            int nx = static_cast<int>(x) + dx;
            int ny = static_cast<int>(y) + dy;

            if (nx >= 0 && nx < static_cast<int>(grid_width_) && ny >= 0
                && ny < static_cast<int>(grid_height_)) {
                result |= (1ULL << (9 + bit_pos));
                if (isSet(nx, ny)) {
                    result |= (1ULL << bit_pos);
                }
            }
        }
    }

    return Neighborhood3x3{ result };
}

} // namespace FallingSand
