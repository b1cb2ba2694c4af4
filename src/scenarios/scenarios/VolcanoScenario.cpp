#include "core/World.h"
#include "scenarios/Scenario.h"

#include <algorithm>

namespace FallingSand {

/**
 * Volcano scenario - a lava source pours onto a rock cone. The lava ignites a wood
 * grove on one side and is cooled into rock by a pond on the other.
 */
class VolcanoScenario : public Scenario {
public:
    VolcanoScenario()
    {
        metadata_.name = "Volcano";
        metadata_.description = "Lava source over a rock cone, with wood and a pond";
        metadata_.category = "demo";
    }

    const ScenarioMetadata& getMetadata() const override { return metadata_; }

    void setup(World& world) override
    {
        world.clear();

        const int width = static_cast<int>(world.getWidth());
        const int height = static_cast<int>(world.getHeight());
        const int centerX = width / 2;
        const int floorY = height - 2;

        // Cone, one row narrower per step up.
        const int coneHeight = height / 4;
        for (int row = 0; row < coneHeight; ++row) {
            const int halfWidth = coneHeight - row;
            fillRect(
                world, centerX - halfWidth, floorY - row, centerX + halfWidth, floorY - row,
                Element::Rock);
        }

        // Wood grove on the left, pond on the right.
        const int groundDepth = std::max(1, height / 8);
        fillRect(world, 1, floorY - groundDepth + 1, width / 5, floorY, Element::Wood);
        fillRect(world, width * 4 / 5, floorY - groundDepth + 1, width - 2, floorY, Element::Water);

        placeCell(world, centerX, 1, Element::LavaSource);
    }

private:
    ScenarioMetadata metadata_;
};

} // namespace FallingSand
