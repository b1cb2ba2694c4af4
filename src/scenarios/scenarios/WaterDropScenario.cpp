#include "core/World.h"
#include "scenarios/Scenario.h"

namespace FallingSand {

/**
 * Water drop scenario - a single water cell at top-centre that falls and spreads
 * along the floor. The water count never changes.
 */
class WaterDropScenario : public Scenario {
public:
    WaterDropScenario()
    {
        metadata_.name = "Water Drop";
        metadata_.description = "A single drop of water released from the top centre";
        metadata_.category = "test";
    }

    const ScenarioMetadata& getMetadata() const override { return metadata_; }

    void setup(World& world) override
    {
        world.clear();
        placeCell(world, static_cast<int>(world.getWidth() / 2), 1, Element::Water);
    }

private:
    ScenarioMetadata metadata_;
};

} // namespace FallingSand
