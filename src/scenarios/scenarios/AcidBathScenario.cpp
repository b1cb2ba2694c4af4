#include "core/World.h"
#include "scenarios/Scenario.h"

#include <algorithm>

namespace FallingSand {

/**
 * Acid bath scenario - a pool of acid with an iron bar across it and a block of sand
 * dropped in. The sand dissolves and the iron rusts.
 */
class AcidBathScenario : public Scenario {
public:
    AcidBathScenario()
    {
        metadata_.name = "Acid Bath";
        metadata_.description = "Sand and iron dropped into a pool of acid";
        metadata_.category = "demo";
    }

    const ScenarioMetadata& getMetadata() const override { return metadata_; }

    void setup(World& world) override
    {
        world.clear();

        const int width = static_cast<int>(world.getWidth());
        const int height = static_cast<int>(world.getHeight());
        const int floorY = height - 2;
        const int poolTop = height * 3 / 4;

        fillRect(world, 1, poolTop, width - 2, floorY, Element::Acid);
        fillRect(world, width / 4, poolTop - 1, width * 3 / 4, poolTop - 1, Element::Iron);

        // Sand block, square-brushed through the toolbox.
        ToolBox& tools = world.getToolBox();
        const Element previousElement = tools.getElement();
        const Tool previousTool = tools.getTool();
        const int previousSize = tools.getToolSize();

        tools.setElement(Element::Sand);
        tools.setTool(Tool::Square);
        tools.setToolSize(std::max(1, width / 8));
        world.applyTool(width / 2, height / 4);

        tools.setElement(previousElement);
        tools.setTool(previousTool);
        tools.setToolSize(previousSize);
    }

private:
    ScenarioMetadata metadata_;
};

} // namespace FallingSand
