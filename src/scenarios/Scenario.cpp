#include "Scenario.h"
#include "core/World.h"

namespace FallingSand {

void Scenario::fillRect(World& world, int x0, int y0, int x1, int y1, Element element)
{
    for (int y = y0; y <= y1; ++y) {
        for (int x = x0; x <= x1; ++x) {
            placeCell(world, x, y, element);
        }
    }
}

void Scenario::placeCell(World& world, int x, int y, Element element)
{
    Grid& grid = world.getGrid();
    if (grid.isInterior(x, y)) {
        grid.setElement(x, y, element, isSourceElement(element));
    }
}

} // namespace FallingSand
