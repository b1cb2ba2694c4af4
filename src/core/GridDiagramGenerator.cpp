#include "GridDiagramGenerator.h"
#include "Grid.h"

#include <sstream>

namespace FallingSand {

char GridDiagramGenerator::elementToChar(Element element)
{
    switch (element) {
        case Element::Air:
            return ' ';
        case Element::Sand:
            return '.';
        case Element::Rock:
            return 'R';
        case Element::Water:
            return '~';
        case Element::Acid:
            return 'a';
        case Element::Drain:
            return 'D';
        case Element::Wood:
            return 'W';
        case Element::Iron:
            return 'I';
        case Element::Rust:
            return 'r';
        case Element::Fire:
            return '^';
        case Element::Ash:
            return ',';
        case Element::Oil:
            return 'o';
        case Element::Lava:
            return 'L';
        case Element::Smoke:
            return '"';
        case Element::Life:
            return '*';
        case Element::Plant:
            return 'p';
        case Element::WaterSource:
            return 'U';
        case Element::AcidSource:
            return 'A';
        case Element::OilSource:
            return 'O';
        case Element::FireSource:
            return 'F';
        case Element::LavaSource:
            return 'V';
        case Element::Indestructible:
            return '#';
    }
    return '?';
}

std::string GridDiagramGenerator::generateAsciiDiagram(const Grid& grid)
{
    std::ostringstream diagram;
    for (uint32_t y = 0; y < grid.getHeight(); ++y) {
        for (uint32_t x = 0; x < grid.getWidth(); ++x) {
            diagram << elementToChar(grid.get(x, y).element);
        }
        diagram << '\n';
    }
    return diagram.str();
}

} // namespace FallingSand
