#include "Scheduler.h"
#include "ElementRules.h"
#include "Grid.h"
#include "LoggingChannels.h"
#include "ScopeTimer.h"
#include "Timers.h"

#include <chrono>
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace FallingSand {

void to_json(nlohmann::json& j, const SimulationState& state)
{
    j = nlohmann::json{ { "running", state.running },
                        { "step", state.step },
                        { "frame_time_ms", state.frame_time_ms },
                        { "ticks", state.ticks } };
}

void from_json(const nlohmann::json& j, SimulationState& state)
{
    if (!j.is_object()) {
        throw std::runtime_error("SimulationState::from_json: JSON value must be an object");
    }
    state.running = j.value("running", true);
    state.step = j.value("step", false);
    state.frame_time_ms = j.value("frame_time_ms", 0.0);
    state.ticks = j.value("ticks", uint64_t{ 0 });
}

Scheduler::Scheduler(Timers& timers) : timers_(timers)
{}

bool Scheduler::advanceTick(Grid& grid, SimulationState& state)
{
    const auto start = std::chrono::steady_clock::now();

    bool swept = false;
    if (state.running || state.step) {
        state.step = false;
        {
            ScopeTimer timer(timers_, "sweep");
            sweep(grid);
        }
        state.ticks++;
        swept = true;
    }

    const auto duration = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start);
    state.frame_time_ms = duration.count() / 1000.0;

    if (swept) {
        LoggingChannels::sim()->trace(
            "Tick {} swept in {:.3f}ms", state.ticks, state.frame_time_ms);
    }
    return swept;
}

void Scheduler::sweep(Grid& grid)
{
    grid.captureLifeSnapshot();

    const bool parity = grid.toggleVisitedState();
    const uint32_t lastX = grid.getWidth() - 1;

    for (uint32_t y = grid.getHeight() - 2; y >= 1; --y) {
        if (parity) {
            for (uint32_t x = 1; x < lastX; ++x) {
                updateCell(grid, x, y);
            }
        }
        else {
            for (uint32_t x = lastX - 1; x >= 1; --x) {
                updateCell(grid, x, y);
            }
        }
    }
}

void Scheduler::updateCell(Grid& grid, uint32_t x, uint32_t y)
{
    const Cell& cell = grid.get(x, y);
    if (cell.visited == grid.isVisitedState()) {
        return;
    }

    bool consumed = false;
    switch (cell.element) {
        case Element::Air:
            consumed = ElementRules::updateAir(grid, x, y);
            break;
        case Element::Sand:
        case Element::Rust:
            consumed = ElementRules::updateSand(grid, x, y);
            break;
        case Element::Ash:
            consumed = ElementRules::updateAsh(grid, x, y);
            break;
        case Element::Water:
            consumed = ElementRules::updateWater(grid, x, y);
            break;
        case Element::Acid:
            consumed = ElementRules::updateAcid(grid, x, y);
            break;
        case Element::Oil:
            consumed = ElementRules::updateOil(grid, x, y);
            break;
        case Element::Drain:
            consumed = ElementRules::updateDrain(grid, x, y);
            break;
        case Element::Fire:
            consumed = ElementRules::updateFire(grid, x, y);
            break;
        case Element::Lava:
            consumed = ElementRules::updateLava(grid, x, y);
            break;
        case Element::Smoke:
            consumed = ElementRules::updateSmoke(grid, x, y);
            break;
        case Element::Life:
            consumed = ElementRules::updateLife(grid, x, y);
            break;
        case Element::Iron:
            consumed = ElementRules::updateIron(grid, x, y);
            break;
        case Element::Plant:
            consumed = ElementRules::updatePlant(grid, x, y);
            break;
        case Element::WaterSource:
        case Element::AcidSource:
        case Element::OilSource:
        case Element::FireSource:
        case Element::LavaSource:
            consumed = ElementRules::updateSource(grid, x, y, getEmittedElement(cell.element));
            break;
        case Element::Wood:
        case Element::Rock:
        case Element::Indestructible:
            break;
    }

    if (!consumed) {
        grid.setVisited(x, y);
    }
}

} // namespace FallingSand
