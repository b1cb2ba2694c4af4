#include "core/World.h"
#include "scenarios/Scenario.h"

#include <algorithm>

namespace FallingSand {

/**
 * Sandbox scenario - a showcase with most element kinds interacting: a water source
 * over plants, an oil slick over a drain, sand on wood with a fire source, and iron
 * resting in water.
 */
class SandboxScenario : public Scenario {
public:
    SandboxScenario()
    {
        metadata_.name = "Sandbox";
        metadata_.description = "Mixed showcase of sources, liquids, fire and growth";
        metadata_.category = "sandbox";
    }

    const ScenarioMetadata& getMetadata() const override { return metadata_; }

    void setup(World& world) override
    {
        world.clear();

        const int width = static_cast<int>(world.getWidth());
        const int height = static_cast<int>(world.getHeight());
        const int floorY = height - 2;
        const int quarter = std::max(1, width / 4);
        const int layer = std::max(1, height / 10);

        // Left quarter: water source raining onto a plant bed.
        fillRect(world, 1, floorY - layer + 1, quarter - 1, floorY, Element::Plant);
        placeCell(world, quarter / 2, 1, Element::WaterSource);

        // Second quarter: oil pool above a drain.
        fillRect(world, quarter, floorY - layer + 1, 2 * quarter - 1, floorY, Element::Oil);
        placeCell(world, quarter + quarter / 2, floorY, Element::Drain);

        // Third quarter: sand heap on a wooden deck, lit by a fire source.
        fillRect(world, 2 * quarter, floorY - layer + 1, 3 * quarter - 1, floorY, Element::Wood);
        fillRect(
            world, 2 * quarter + quarter / 4, floorY - 2 * layer + 1, 3 * quarter - quarter / 4,
            floorY - layer, Element::Sand);
        placeCell(world, 2 * quarter + quarter / 2, height / 3, Element::FireSource);

        // Right quarter: iron in a water tank walled by rock.
        fillRect(world, 3 * quarter, floorY - 2 * layer, 3 * quarter, floorY, Element::Rock);
        fillRect(world, 3 * quarter + 1, floorY - layer + 1, width - 2, floorY, Element::Water);
        fillRect(
            world, 3 * quarter + 2, floorY - layer, width - 3, floorY - layer, Element::Iron);
    }

private:
    ScenarioMetadata metadata_;
};

} // namespace FallingSand
