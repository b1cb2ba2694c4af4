#include "core/World.h"
#include "scenarios/Scenario.h"

namespace FallingSand {

/**
 * Empty scenario - nothing but the border.
 */
class EmptyScenario : public Scenario {
public:
    EmptyScenario()
    {
        metadata_.name = "Empty";
        metadata_.description = "An empty grid with only the indestructible border";
        metadata_.category = "basic";
    }

    const ScenarioMetadata& getMetadata() const override { return metadata_; }

    void setup(World& world) override { world.clear(); }

private:
    ScenarioMetadata metadata_;
};

} // namespace FallingSand
