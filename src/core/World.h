#pragma once

#include "Grid.h"
#include "Scheduler.h"
#include "Timers.h"
#include "ToolBox.h"

#include <cstdint>
#include <memory>
#include <optional>

namespace FallingSand {

/**
 * World owns everything one sandbox session mutates: the grid, the run/step
 * state, the editing tools and the scheduler with its timers.
 *
 * The scheduler holds a reference to the timers, so a World is neither
 * copyable nor movable. Hold it by unique_ptr when it needs to change hands.
 */
class World {
public:
    // Without a seed the random source is seeded from std::random_device.
    World(uint32_t width, uint32_t height, std::optional<uint32_t> seed = std::nullopt);
    ~World();

    World(const World&) = delete;
    World& operator=(const World&) = delete;

    // =================================================================
    // SIMULATION CONTROL
    // =================================================================

    // Run one tick if running or a step was requested. Returns true if a sweep ran.
    bool advanceTick();

    // Run exactly one tick regardless of the running flag.
    void requestStep() { state_.step = true; }

    void setRunning(bool running);
    bool isRunning() const { return state_.running; }

    const SimulationState& getState() const { return state_; }

    // =================================================================
    // GRID MANAGEMENT
    // =================================================================

    // Reset the interior to Air.
    void clear();

    // Replace the grid with a fresh one. Reseeds from the stored seed, if any.
    void resize(uint32_t width, uint32_t height);

    // Swap in a freshly seeded random source and remember the seed for resize().
    void setRandomSeed(uint32_t seed);
    std::optional<uint32_t> getRandomSeed() const { return seed_; }

    Grid& getGrid() { return *grid_; }
    const Grid& getGrid() const { return *grid_; }

    uint32_t getWidth() const { return grid_->getWidth(); }
    uint32_t getHeight() const { return grid_->getHeight(); }

    // =================================================================
    // EDITING
    // =================================================================

    ToolBox& getToolBox() { return toolbox_; }
    const ToolBox& getToolBox() const { return toolbox_; }

    void applyTool(int x, int y) { toolbox_.apply(*grid_, x, y); }
    void eraseTool(int x, int y) { toolbox_.erase(*grid_, x, y); }

    // =================================================================
    // DIAGNOSTICS
    // =================================================================

    Timers& getTimers() { return timers_; }
    const Timers& getTimers() const { return timers_; }
    void dumpTimerStats() const { timers_.dumpTimerStats(); }

private:
    std::unique_ptr<RandomSource> makeSeededSource() const;

    std::optional<uint32_t> seed_;
    std::unique_ptr<Grid> grid_;
    SimulationState state_;
    ToolBox toolbox_;
    Timers timers_;
    Scheduler scheduler_;
};

} // namespace FallingSand
