#pragma once

#include "core/Result.h"
#include "core/SandboxConfig.h"
#include "core/SimulationStats.h"
#include "core/World.h"
#include "scenarios/ScenarioRegistry.h"

#include <cstdint>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

namespace FallingSand {
namespace Client {

/**
 * @brief Summary of one headless run.
 */
struct RunResults {
    std::string scenario;
    uint32_t width = 0;
    uint32_t height = 0;
    uint32_t steps = 0;
    uint64_t ticks = 0;
    double duration_ms = 0.0;
    double avg_tick_ms = 0.0;

    SimulationStats stats;
    nlohmann::json timer_stats;
};

void to_json(nlohmann::json& j, const RunResults& results);

/**
 * @brief Builds a World from a SandboxConfig and advances it headlessly.
 *
 * The World stays alive after run() so the caller can inspect the final grid.
 */
class SimulationRunner {
public:
    SimulationRunner();

    /**
     * Set up the scenario and placements, then advance `steps` ticks.
     * A config with running == false still advances: each tick is a requested step.
     */
    Result<RunResults, std::string> run(const SandboxConfig& config, uint32_t steps);

    const ScenarioRegistry& getRegistry() const { return registry_; }

    // Null until run() has built a world.
    const World* getWorld() const { return world_.get(); }

private:
    ScenarioRegistry registry_;
    std::unique_ptr<World> world_;
};

// Timer stats as an array sorted by total_ms, descending.
nlohmann::json sortTimerStats(const nlohmann::json& timerStats);

} // namespace Client
} // namespace FallingSand
