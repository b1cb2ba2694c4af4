#pragma once

#include "Cell.h"
#include "Element.h"
#include "RandomSource.h"
#include "bitmaps/CellBitmap.h"

#include <cassert>
#include <cstdint>
#include <memory>
#include <vector>

namespace FallingSand {

/**
 * Grid: the bordered 2D array of cells, sweep parity and random source.
 *
 * Design:
 * - Every border cell is Indestructible. setElement() and swap() are no-ops on them,
 *   so rules can read all 8 neighbours of any interior cell without bounds checks.
 * - Cells are stored row-major: index(x, y) = x + y * width.
 * - A cell whose visited flag equals the current parity has been processed this tick.
 * - Life occupancy is captured once per tick so Conway counts see a single generation.
 *
 * Usage:
 *   Grid grid(64, 64, makeRandomSource(42));
 *   grid.setElement(10, 10, Element::Sand);
 *   const Cell& cell = grid.get(10, 10);
 */
class Grid {
public:
    Grid(uint32_t width, uint32_t height, std::unique_ptr<RandomSource> random = nullptr);

    Grid(const Grid&) = delete;
    Grid& operator=(const Grid&) = delete;
    Grid(Grid&&) = default;
    Grid& operator=(Grid&&) = default;

    // =================================================================
    // CELL ACCESS
    // =================================================================

    inline const Cell& get(uint32_t x, uint32_t y) const { return cells_[index(x, y)]; }

    inline Cell& getMut(uint32_t x, uint32_t y) { return cells_[index(x, y)]; }

    const std::vector<Cell>& getCells() const { return cells_; }

    // =================================================================
    // MUTATION PRIMITIVES
    // =================================================================

    // Place an element. No-op on Indestructible cells.
    void setElement(uint32_t x, uint32_t y, Element element, bool source = false);

    // Exchange two cells. No-op if either is Indestructible.
    void swap(uint32_t x, uint32_t y, uint32_t x2, uint32_t y2);

    // Decrement strength if above 1. Returns false (unchanged) otherwise.
    bool reduceStrength(uint32_t x, uint32_t y);

    void clearCell(uint32_t x, uint32_t y) { setElement(x, y, Element::Air, false); }

    void setVisited(uint32_t x, uint32_t y) { cells_[index(x, y)].visited = visited_state_; }

    // Reset every interior cell to Air. The border is untouched.
    void clear();

    // =================================================================
    // SWEEP PARITY
    // =================================================================

    bool toggleVisitedState()
    {
        visited_state_ = !visited_state_;
        return visited_state_;
    }

    bool isVisitedState() const { return visited_state_; }

    // =================================================================
    // RANDOMNESS
    // =================================================================

    // x + 1 or x - 1 with equal probability.
    uint32_t randomNeighbourX(uint32_t x);

    // Uniform draw from [0, max).
    uint32_t random(uint32_t max) { return random_->next(max); }

    void setRandomSource(std::unique_ptr<RandomSource> random);

    // =================================================================
    // LIFE GENERATION
    // =================================================================

    // Record which cells hold Life right now.
    void captureLifeSnapshot();

    // Moore neighbours that held Life at the last snapshot.
    int countLiveNeighbours(uint32_t x, uint32_t y) const;

    // =================================================================
    // DIMENSIONS
    // =================================================================

    uint32_t getWidth() const { return width_; }
    uint32_t getHeight() const { return height_; }

    bool isInterior(int x, int y) const
    {
        return x >= 1 && y >= 1 && x < static_cast<int>(width_) - 1
            && y < static_cast<int>(height_) - 1;
    }

private:
    inline size_t index(uint32_t x, uint32_t y) const
    {
        assert(x < width_ && y < height_);
        return static_cast<size_t>(x) + static_cast<size_t>(y) * width_;
    }

    void setupBorder();

    uint32_t width_;
    uint32_t height_;
    std::vector<Cell> cells_;
    bool visited_state_ = false;
    std::unique_ptr<RandomSource> random_;
    CellBitmap life_snapshot_;
};

} // namespace FallingSand
