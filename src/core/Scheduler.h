#pragma once

#include <cstdint>
#include <nlohmann/json_fwd.hpp>

namespace FallingSand {

class Grid;
class Timers;

/**
 * Run/step flags and diagnostics that persist between ticks.
 */
struct SimulationState {
    bool running = true;
    bool step = false;          // Consumed by the next tick.
    double frame_time_ms = 0.0; // Wall-clock duration of the last sweep.
    uint64_t ticks = 0;         // Sweeps actually performed.
};

void to_json(nlohmann::json& j, const SimulationState& state);
void from_json(const nlohmann::json& j, SimulationState& state);

/**
 * Drives one discrete tick over a Grid.
 *
 * Rows are swept bottom-up from height-2 to 1. The horizontal direction alternates
 * with the sweep parity: left to right when the freshly toggled parity is true,
 * right to left otherwise. Cells already stamped with the current parity are skipped.
 */
class Scheduler {
public:
    explicit Scheduler(Timers& timers);

    /**
     * Advance one tick if running or a single step was requested.
     * @return true if a sweep was performed.
     */
    bool advanceTick(Grid& grid, SimulationState& state);

    // Dispatch a single interior cell and stamp it if its rule did not.
    static void updateCell(Grid& grid, uint32_t x, uint32_t y);

private:
    void sweep(Grid& grid);

    Timers& timers_;
};

} // namespace FallingSand
