#include "core/World.h"
#include "scenarios/Scenario.h"

namespace FallingSand {

/**
 * Glider scenario - a single Life glider in the top-left corner, heading down-right.
 *
 *   . * .
 *   . . *
 *   * * *
 */
class GliderScenario : public Scenario {
public:
    GliderScenario()
    {
        metadata_.name = "Glider";
        metadata_.description = "A Game of Life glider travelling diagonally";
        metadata_.category = "test";
    }

    const ScenarioMetadata& getMetadata() const override { return metadata_; }

    void setup(World& world) override
    {
        world.clear();

        constexpr int originX = 2;
        constexpr int originY = 2;
        placeCell(world, originX + 1, originY, Element::Life);
        placeCell(world, originX + 2, originY + 1, Element::Life);
        placeCell(world, originX, originY + 2, Element::Life);
        placeCell(world, originX + 1, originY + 2, Element::Life);
        placeCell(world, originX + 2, originY + 2, Element::Life);
    }

private:
    ScenarioMetadata metadata_;
};

} // namespace FallingSand
