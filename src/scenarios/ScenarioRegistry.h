#pragma once

#include "Scenario.h"
#include "core/Result.h"

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace FallingSand {

/**
 * Id -> scenario factory map. Each lookup builds a fresh scenario instance.
 */
class ScenarioRegistry {
public:
    ScenarioRegistry() = default;

    // Registry with every built-in scenario.
    static ScenarioRegistry createDefault();

    using ScenarioFactory = std::function<std::unique_ptr<Scenario>()>;
    void registerScenario(
        const std::string& id, const ScenarioMetadata& metadata, ScenarioFactory factory);

    // nullptr when the id is unknown.
    std::unique_ptr<Scenario> createScenario(const std::string& id) const;

    // Build the scenario and run its setup on the world.
    Result<std::monostate, std::string> applyScenario(const std::string& id, World& world) const;

    const ScenarioMetadata* getMetadata(const std::string& id) const;

    // Sorted alphabetically.
    std::vector<std::string> getScenarioIds() const;

    std::vector<std::string> getScenariosByCategory(const std::string& category) const;

    void clear();

private:
    struct ScenarioEntry {
        ScenarioMetadata metadata;
        ScenarioFactory factory;
    };
    std::unordered_map<std::string, ScenarioEntry> scenarios_;
};

} // namespace FallingSand
