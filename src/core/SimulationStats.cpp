#include "SimulationStats.h"
#include "Grid.h"
#include "Scheduler.h"

#include <nlohmann/json.hpp>

namespace FallingSand {

SimulationStats computeStats(const Grid& grid)
{
    SimulationStats stats;
    stats.width = grid.getWidth();
    stats.height = grid.getHeight();
    stats.totalCells = stats.width * stats.height;
    stats.interiorCells = (stats.width - 2) * (stats.height - 2);

    for (uint32_t y = 0; y < stats.height; ++y) {
        for (uint32_t x = 0; x < stats.width; ++x) {
            const Cell& cell = grid.get(x, y);
            stats.elementCounts[static_cast<size_t>(cell.element)]++;
            if (cell.source) {
                stats.sourceCells++;
            }
            if (grid.isInterior(x, y) && !cell.isAir()) {
                stats.occupiedCells++;
            }
        }
    }
    return stats;
}

SimulationStats computeStats(const Grid& grid, const SimulationState& state)
{
    SimulationStats stats = computeStats(grid);
    stats.ticks = state.ticks;
    stats.frameTimeMs = state.frame_time_ms;
    return stats;
}

void to_json(nlohmann::json& j, const SimulationStats& stats)
{
    nlohmann::json counts = nlohmann::json::object();
    for (size_t i = 0; i < ELEMENT_COUNT; ++i) {
        if (stats.elementCounts[i] > 0) {
            counts[getElementName(static_cast<Element>(i))] = stats.elementCounts[i];
        }
    }

    j = nlohmann::json{ { "width", stats.width },
                        { "height", stats.height },
                        { "total_cells", stats.totalCells },
                        { "interior_cells", stats.interiorCells },
                        { "occupied_cells", stats.occupiedCells },
                        { "source_cells", stats.sourceCells },
                        { "elements", counts },
                        { "ticks", stats.ticks },
                        { "frame_time_ms", stats.frameTimeMs } };
}

} // namespace FallingSand
