#pragma once

#include "Element.h"

#include <array>
#include <cstdint>
#include <nlohmann/json_fwd.hpp>

namespace FallingSand {

class Grid;
struct SimulationState;

/**
 * @brief Aggregate counts over a whole grid, border included.
 *
 * Computed on demand; cheap enough for tests and the CLI but not meant to run
 * every tick in an interactive loop.
 */
struct SimulationStats {
    uint32_t width = 0;
    uint32_t height = 0;
    uint32_t totalCells = 0;
    uint32_t interiorCells = 0;
    uint32_t occupiedCells = 0; ///< Interior cells holding anything but Air.
    uint32_t sourceCells = 0;   ///< Cells with the source flag set.

    std::array<uint32_t, ELEMENT_COUNT> elementCounts{};

    uint64_t ticks = 0;
    double frameTimeMs = 0.0;

    uint32_t count(Element element) const
    {
        return elementCounts[static_cast<size_t>(element)];
    }
};

SimulationStats computeStats(const Grid& grid);
SimulationStats computeStats(const Grid& grid, const SimulationState& state);

// Element counts are keyed by element name; zero counts are omitted.
void to_json(nlohmann::json& j, const SimulationStats& stats);

} // namespace FallingSand
