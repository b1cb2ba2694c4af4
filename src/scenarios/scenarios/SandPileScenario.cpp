#include "core/World.h"
#include "scenarios/Scenario.h"

#include <algorithm>

namespace FallingSand {

/**
 * Sand pile scenario - a column of sand dropped onto a rock shelf. The sand piles
 * up on the shelf and spills over its edges to the floor.
 */
class SandPileScenario : public Scenario {
public:
    SandPileScenario()
    {
        metadata_.name = "Sand Pile";
        metadata_.description = "A sand column collapsing onto a rock shelf";
        metadata_.category = "demo";
    }

    const ScenarioMetadata& getMetadata() const override { return metadata_; }

    void setup(World& world) override
    {
        world.clear();

        const int width = static_cast<int>(world.getWidth());
        const int height = static_cast<int>(world.getHeight());
        const int centerX = width / 2;

        const int shelfY = height * 3 / 4;
        fillRect(world, width / 4, shelfY, width * 3 / 4, shelfY, Element::Rock);

        const int halfColumn = std::max(1, width / 16);
        fillRect(world, centerX - halfColumn, 1, centerX + halfColumn, height / 3, Element::Sand);
    }

private:
    ScenarioMetadata metadata_;
};

} // namespace FallingSand
