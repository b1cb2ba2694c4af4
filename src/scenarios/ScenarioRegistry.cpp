#include "ScenarioRegistry.h"
#include "core/LoggingChannels.h"

#include <algorithm>

// Scenario implementations.
#include "scenarios/AcidBathScenario.cpp"
#include "scenarios/EmptyScenario.cpp"
#include "scenarios/GliderScenario.cpp"
#include "scenarios/SandPileScenario.cpp"
#include "scenarios/SandboxScenario.cpp"
#include "scenarios/VolcanoScenario.cpp"
#include "scenarios/WaterDropScenario.cpp"

namespace FallingSand {

namespace {

template <typename ScenarioT>
void registerBuiltin(ScenarioRegistry& registry, const std::string& id)
{
    const ScenarioT prototype;
    registry.registerScenario(
        id, prototype.getMetadata(), []() { return std::make_unique<ScenarioT>(); });
}

} // namespace

ScenarioRegistry ScenarioRegistry::createDefault()
{
    ScenarioRegistry registry;
    registerBuiltin<AcidBathScenario>(registry, "acid_bath");
    registerBuiltin<EmptyScenario>(registry, "empty");
    registerBuiltin<GliderScenario>(registry, "glider");
    registerBuiltin<SandPileScenario>(registry, "sand_pile");
    registerBuiltin<SandboxScenario>(registry, "sandbox");
    registerBuiltin<VolcanoScenario>(registry, "volcano");
    registerBuiltin<WaterDropScenario>(registry, "water_drop");
    return registry;
}

void ScenarioRegistry::registerScenario(
    const std::string& id, const ScenarioMetadata& metadata, ScenarioFactory factory)
{
    if (!factory) {
        LoggingChannels::scenario()->error(
            "Attempted to register null factory for scenario ID: {}", id);
        return;
    }

    if (scenarios_.find(id) != scenarios_.end()) {
        LoggingChannels::scenario()->warn(
            "Scenario with ID '{}' already registered, overwriting", id);
    }

    LoggingChannels::scenario()->debug("Registering scenario '{}' - {}", id, metadata.name);
    scenarios_[id] = ScenarioEntry{ metadata, std::move(factory) };
}

std::unique_ptr<Scenario> ScenarioRegistry::createScenario(const std::string& id) const
{
    auto it = scenarios_.find(id);
    if (it != scenarios_.end()) {
        return it->second.factory();
    }
    return nullptr;
}

Result<std::monostate, std::string> ScenarioRegistry::applyScenario(
    const std::string& id, World& world) const
{
    auto scenario = createScenario(id);
    if (!scenario) {
        LoggingChannels::scenario()->error("Scenario '{}' not found in registry", id);
        return Result<std::monostate, std::string>::error("Unknown scenario '" + id + "'");
    }

    LoggingChannels::scenario()->info("Setting up scenario '{}'", id);
    scenario->setup(world);
    return Result<std::monostate, std::string>::okay();
}

const ScenarioMetadata* ScenarioRegistry::getMetadata(const std::string& id) const
{
    auto it = scenarios_.find(id);
    if (it != scenarios_.end()) {
        return &it->second.metadata;
    }
    return nullptr;
}

std::vector<std::string> ScenarioRegistry::getScenarioIds() const
{
    std::vector<std::string> ids;
    ids.reserve(scenarios_.size());
    for (const auto& [id, entry] : scenarios_) {
        ids.push_back(id);
    }

    std::sort(ids.begin(), ids.end());
    return ids;
}

std::vector<std::string> ScenarioRegistry::getScenariosByCategory(const std::string& category) const
{
    std::vector<std::string> ids;
    for (const auto& [id, entry] : scenarios_) {
        if (entry.metadata.category == category) {
            ids.push_back(id);
        }
    }

    std::sort(ids.begin(), ids.end());
    return ids;
}

void ScenarioRegistry::clear()
{
    scenarios_.clear();
}

} // namespace FallingSand
