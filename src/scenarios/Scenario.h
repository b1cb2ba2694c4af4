#pragma once

#include "core/Element.h"

#include <cstdint>
#include <string>

namespace FallingSand {

class World;

struct ScenarioMetadata {
    std::string name;        // Display name
    std::string description; // Help text
    std::string category;    // demo, test or sandbox
};

/**
 * A named starting layout. setup() clears the world and stamps the layout through
 * the Grid and ToolBox, scaled to whatever size the world currently has.
 * Shapes that do not fit are clipped to the interior.
 */
class Scenario {
public:
    virtual ~Scenario() = default;

    virtual const ScenarioMetadata& getMetadata() const = 0;

    virtual void setup(World& world) = 0;

protected:
    // Fill the inclusive rectangle [x0, x1] x [y0, y1], clipped to the interior.
    static void fillRect(World& world, int x0, int y0, int x1, int y1, Element element);

    // Place one cell if it is interior. Source kinds get the source flag.
    static void placeCell(World& world, int x, int y, Element element);
};

} // namespace FallingSand
