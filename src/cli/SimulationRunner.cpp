#include "SimulationRunner.h"
#include "core/LoggingChannels.h"

#include <algorithm>
#include <chrono>
#include <new>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace FallingSand {
namespace Client {

void to_json(nlohmann::json& j, const RunResults& results)
{
    j = nlohmann::json{ { "scenario", results.scenario },
                        { "grid_size",
                          std::to_string(results.width) + "x" + std::to_string(results.height) },
                        { "steps", results.steps },
                        { "ticks", results.ticks },
                        { "duration_ms", results.duration_ms },
                        { "avg_tick_ms", results.avg_tick_ms },
                        { "stats", results.stats } };
    if (!results.timer_stats.empty()) {
        j["timer_stats"] = sortTimerStats(results.timer_stats);
    }
}

SimulationRunner::SimulationRunner() : registry_(ScenarioRegistry::createDefault())
{}

Result<RunResults, std::string> SimulationRunner::run(const SandboxConfig& config, uint32_t steps)
{
    using ResultT = Result<RunResults, std::string>;

    if (!registry_.getMetadata(config.scenario)) {
        return ResultT::error("Unknown scenario '" + config.scenario + "'");
    }

    auto valid = validateSandboxConfig(config);
    if (valid.isError()) {
        return ResultT::error(valid.errorValue());
    }

    try {
        world_ = std::make_unique<World>(config.width, config.height, config.seed);
    }
    catch (const std::invalid_argument& e) {
        return ResultT::error(e.what());
    }
    catch (const std::bad_alloc&) {
        return ResultT::error(
            "Cannot allocate a " + std::to_string(config.width) + "x"
            + std::to_string(config.height) + " grid");
    }

    auto setup = registry_.applyScenario(config.scenario, *world_);
    if (setup.isError()) {
        return ResultT::error(setup.errorValue());
    }
    applyPlacements(*world_, config.placements);
    world_->setRunning(config.running);

    LoggingChannels::sim()->info(
        "Running '{}' on {}x{} for {} steps", config.scenario, config.width, config.height, steps);

    const auto start = std::chrono::steady_clock::now();
    for (uint32_t i = 0; i < steps; ++i) {
        if (!world_->isRunning()) {
            world_->requestStep();
        }
        world_->advanceTick();
    }
    const auto duration = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start);

    RunResults results;
    results.scenario = config.scenario;
    results.width = world_->getWidth();
    results.height = world_->getHeight();
    results.steps = steps;
    results.ticks = world_->getState().ticks;
    results.duration_ms = duration.count() / 1000.0;
    results.avg_tick_ms = results.ticks > 0 ? results.duration_ms / results.ticks : 0.0;
    results.stats = computeStats(world_->getGrid(), world_->getState());
    results.timer_stats = world_->getTimers().exportAllTimersAsJson();

    LoggingChannels::sim()->info(
        "Completed {} ticks in {:.2f}ms ({:.3f}ms avg)",
        results.ticks,
        results.duration_ms,
        results.avg_tick_ms);
    world_->dumpTimerStats();

    return ResultT::okay(std::move(results));
}

nlohmann::json sortTimerStats(const nlohmann::json& timerStats)
{
    if (timerStats.empty()) {
        return nlohmann::json::array();
    }

    std::vector<std::pair<std::string, nlohmann::json>> timerPairs;
    for (auto it = timerStats.begin(); it != timerStats.end(); ++it) {
        timerPairs.push_back({ it.key(), it.value() });
    }

    std::sort(timerPairs.begin(), timerPairs.end(), [](const auto& a, const auto& b) {
        return a.second.value("total_ms", 0.0) > b.second.value("total_ms", 0.0);
    });

    nlohmann::json sorted = nlohmann::json::array();
    for (const auto& pair : timerPairs) {
        nlohmann::json entry = pair.second;
        entry["name"] = pair.first;
        sorted.push_back(entry);
    }
    return sorted;
}

} // namespace Client
} // namespace FallingSand
