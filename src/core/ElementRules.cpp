#include "ElementRules.h"
#include "Grid.h"
#include "LoggingChannels.h"

namespace FallingSand {
namespace ElementRules {

namespace {

constexpr uint32_t WATER_FLOW_DISTANCE = 16;
constexpr uint32_t ACID_FLOW_DISTANCE = 8;
constexpr uint32_t OIL_FLOW_DISTANCE = 8;

constexpr uint8_t LAVA_COOLING_THRESHOLD = 64;

// Column n cells to the side of x, or nullopt when it leaves the interior.
std::optional<uint32_t> lateralColumn(const Grid& grid, uint32_t x, uint32_t n, bool left)
{
    if (left) {
        if (x > n) return x - n;
        return std::nullopt;
    }
    if (x + n < grid.getWidth() - 1) return x + n;
    return std::nullopt;
}

bool isLiquid(const Grid& grid, uint32_t x, uint32_t y)
{
    return isElementLiquid(grid.get(x, y).element);
}

} // namespace

bool updateSand(Grid& grid, uint32_t x, uint32_t y)
{
    const Element below = grid.get(x, y + 1).element;
    if (below == Element::Air || below == Element::Water || below == Element::Fire
        || below == Element::Oil) {
        grid.swap(x, y, x, y + 1);
        return true;
    }

    if (below == Element::Acid) {
        if (grid.getMut(x, y).dissolveTo(Element::Air)) {
            grid.clearCell(x, y + 1);
            return false;
        }
        grid.swap(x, y, x, y + 1);
        return true;
    }

    const uint32_t nx = grid.randomNeighbourX(x);
    const Element diagonal = grid.get(nx, y + 1).element;
    if (diagonal == Element::Air || diagonal == Element::Water) {
        grid.swap(x, y, nx, y + 1);
        return true;
    }

    // The diagonal acid is the one that wears down here.
    if (diagonal == Element::Acid) {
        if (grid.getMut(nx, y + 1).dissolveTo(Element::Air)) {
            grid.clearCell(x, y);
            return true;
        }
        grid.swap(x, y, nx, y + 1);
        return true;
    }

    return false;
}

bool updateAsh(Grid& grid, uint32_t x, uint32_t y)
{
    return updateSand(grid, x, y);
}

bool updateWater(Grid& grid, uint32_t x, uint32_t y)
{
    const uint32_t draw = grid.random(60);
    uint32_t checkX = x;
    if (draw == 58) {
        checkX = x - 1;
    }
    else if (draw == 59) {
        checkX = x + 1;
    }

    if (auto result = touchWater(grid, x, y, checkX, y + 1, draw)) {
        return *result;
    }

    const bool left = draw < 30;
    for (uint32_t n = 1; n < WATER_FLOW_DISTANCE; ++n) {
        const auto column = lateralColumn(grid, x, n, left);
        if (!column) break;

        const Element neighbour = grid.get(*column, y).element;
        if (auto result = touchWater(grid, x, y, *column, y, draw)) {
            return *result;
        }
        if (neighbour != Element::Water) break;
    }
    return false;
}

std::optional<bool> touchWater(
    Grid& grid, uint32_t waterX, uint32_t waterY, uint32_t otherX, uint32_t otherY, uint32_t draw)
{
    const Element other = grid.get(otherX, otherY).element;
    switch (other) {
        case Element::Air:
        case Element::Oil:
            grid.swap(waterX, waterY, otherX, otherY);
            return true;

        case Element::Acid:
            grid.getMut(otherX, otherY).dissolveTo(Element::Water);
            if (waterY < otherY && draw % 2 == 0) {
                grid.swap(waterX, waterY, otherX, otherY);
            }
            return false;

        case Element::Lava:
            if (grid.getMut(otherX, otherY).dissolveTo(Element::Rock)) {
                LoggingChannels::rules()->trace(
                    "Lava at ({},{}) cooled to rock", otherX, otherY);
                grid.clearCell(waterX, waterY);
            }
            return false;

        case Element::Fire:
            grid.clearCell(waterX, waterY);
            grid.setElement(otherX, otherY, Element::Water);
            return true;

        default:
            return std::nullopt;
    }
}

bool updateAcid(Grid& grid, uint32_t x, uint32_t y)
{
    const uint32_t draw = grid.random(60);
    uint32_t checkX = x + 1;
    if (draw < 50) {
        checkX = x;
    }
    else if (draw < 55) {
        checkX = x - 1;
    }

    const Element below = grid.get(checkX, y + 1).element;
    if (below == Element::Air || below == Element::Fire) {
        grid.swap(x, y, checkX, y + 1);
        return true;
    }

    if (below == Element::Water) {
        grid.getMut(x, y).dissolveTo(Element::Water);
        return false;
    }

    if (elementDissolvesInAcid(below)) {
        if (grid.getMut(checkX, y + 1).dissolveTo(Element::Air)) {
            grid.clearCell(x, y);
            return true;
        }
        return false;
    }

    const bool left = draw < 30;
    for (uint32_t n = 1; n < ACID_FLOW_DISTANCE; ++n) {
        const auto column = lateralColumn(grid, x, n, left);
        if (!column) break;

        const Element neighbour = grid.get(*column, y).element;
        if (neighbour == Element::Air) {
            grid.swap(x, y, *column, y);
            return true;
        }
        if (elementDissolvesInAcid(neighbour)) {
            if (grid.getMut(*column, y).dissolveTo(Element::Air)) {
                grid.clearCell(x, y);
                return true;
            }
            return false;
        }
        if (neighbour != Element::Acid) break;
    }
    return false;
}

bool updateOil(Grid& grid, uint32_t x, uint32_t y)
{
    const uint32_t draw = grid.random(500);
    uint32_t checkX = x + 1;
    if (draw > 50) {
        checkX = x;
    }
    else if (draw > 25) {
        checkX = x - 1;
    }

    const Element below = grid.get(checkX, y + 1).element;
    if (below == Element::Air || below == Element::Acid) {
        grid.swap(x, y, checkX, y + 1);
        return true;
    }

    const bool left = draw < 250;
    for (uint32_t n = 1; n < OIL_FLOW_DISTANCE; ++n) {
        const auto column = lateralColumn(grid, x, n, left);
        if (!column) break;

        const Element neighbour = grid.get(*column, y).element;
        if (neighbour == Element::Air || (n == 1 && neighbour == Element::Acid)) {
            grid.swap(x, y, *column, y);
            return true;
        }
        if (neighbour != Element::Oil) break;
    }
    return false;
}

bool updateDrain(Grid& grid, uint32_t x, uint32_t y)
{
    const uint32_t candidates[3][2] = { { x, y - 1 }, { x - 1, y }, { x + 1, y } };
    for (const auto& pos : candidates) {
        if (isLiquid(grid, pos[0], pos[1])) {
            grid.clearCell(pos[0], pos[1]);
            grid.setVisited(x, y);
            return true;
        }
    }
    return false;
}

bool updateFire(Grid& grid, uint32_t x, uint32_t y)
{
    const uint32_t draw = grid.random(5);
    const bool decayRoll = draw > 3;
    if (decayRoll && !grid.reduceStrength(x, y)) {
        grid.setElement(x, y, Element::Smoke);
        return true;
    }

    // Flicker.
    Cell& cell = grid.getMut(x, y);
    cell.variant = static_cast<uint8_t>((cell.variant + draw * 10) % 255);

    uint32_t nx = x;
    uint32_t ny = y - 1;
    switch (draw) {
        case 0:
            ny = y + 1;
            break;
        case 1:
            nx = x + 1;
            ny = y;
            break;
        case 2:
            nx = x - 1;
            ny = y;
            break;
        default:
            break;
    }

    const Element target = grid.get(nx, ny).element;
    if (target == Element::Air) {
        grid.swap(x, y, nx, ny);
        return true;
    }

    if (elementBurns(target)) {
        if (getElementForm(target) == ElementForm::Solid && decayRoll) {
            grid.getMut(nx, ny).dissolveTo(Element::Ash);
        }
        else {
            grid.getMut(nx, ny).dissolveTo(Element::Fire);
        }
    }
    return false;
}

bool updateLava(Grid& grid, uint32_t x, uint32_t y)
{
    const uint32_t draw = grid.random(500);

    // Glow.
    Cell& cell = grid.getMut(x, y);
    cell.variant = static_cast<uint8_t>((cell.variant + static_cast<uint8_t>(draw)) % 255);

    if (draw < 250 && cell.strength < LAVA_COOLING_THRESHOLD) {
        if (cell.dissolveTo(Element::Rock)) {
            LoggingChannels::rules()->trace("Lava at ({},{}) solidified", x, y);
            return false;
        }
    }

    // Sparks.
    if (draw == 0 && grid.get(x, y - 1).element == Element::Air) {
        grid.setElement(x, y - 1, Element::Fire);
    }

    if (auto result = touchLava(grid, x, y, x, y + 1)) {
        return *result;
    }

    const uint32_t nx = grid.randomNeighbourX(x);
    if (auto result = touchLava(grid, x, y, nx, y + 1)) {
        return *result;
    }
    if (auto result = touchLava(grid, x, y, nx, y)) {
        return *result;
    }
    return false;
}

std::optional<bool> touchLava(
    Grid& grid, uint32_t lavaX, uint32_t lavaY, uint32_t otherX, uint32_t otherY)
{
    const Element other = grid.get(otherX, otherY).element;
    if (other == Element::Air || other == Element::Acid || other == Element::Water
        || other == Element::Fire) {
        grid.swap(lavaX, lavaY, otherX, otherY);
        return true;
    }

    if (elementBurns(other)) {
        grid.getMut(otherX, otherY).dissolveTo(Element::Fire);
        return false;
    }
    return std::nullopt;
}

bool updateSmoke(Grid& grid, uint32_t x, uint32_t y)
{
    const uint32_t draw = grid.random(5);
    if (draw > 1 && !grid.reduceStrength(x, y)) {
        grid.clearCell(x, y);
        return true;
    }

    uint32_t nx = x;
    uint32_t ny = y - 1;
    if (draw == 0) {
        nx = x + 1;
        ny = y;
    }
    else if (draw == 1) {
        nx = x - 1;
        ny = y;
    }

    const Element target = grid.get(nx, ny).element;
    if (target == Element::Air) {
        grid.swap(x, y, nx, ny);
        return true;
    }
    if (target == Element::Fire || isElementLiquid(target)) {
        grid.clearCell(x, y);
        return true;
    }
    return false;
}

bool updateIron(Grid& grid, uint32_t x, uint32_t y)
{
    const bool rustyNeighbour = elementCausesRust(grid.get(x - 1, y).element)
        || elementCausesRust(grid.get(x + 1, y).element)
        || elementCausesRust(grid.get(x, y - 1).element)
        || elementCausesRust(grid.get(x, y + 1).element);
    if (!rustyNeighbour) {
        return false;
    }

    if (grid.random(5) > 2 && !grid.reduceStrength(x, y)) {
        LoggingChannels::rules()->trace("Iron at ({},{}) rusted through", x, y);
        grid.setElement(x, y, Element::Rust);
        return true;
    }
    return false;
}

bool updatePlant(Grid& grid, uint32_t x, uint32_t y)
{
    const uint32_t neighbours[4][2] = { { x - 1, y }, { x + 1, y }, { x, y - 1 }, { x, y + 1 } };

    int grown = 0;
    for (const auto& pos : neighbours) {
        if (grid.random(10) <= 1 && elementGrowsPlant(grid.get(pos[0], pos[1]).element)) {
            grid.setElement(pos[0], pos[1], Element::Plant);
            grown++;
        }
    }

    if (grown > 0) {
        grid.setVisited(x, y);
        return true;
    }
    return false;
}

bool updateSource(Grid& grid, uint32_t x, uint32_t y, Element emitted)
{
    if (grid.get(x, y + 1).element == emitted) {
        return false;
    }

    grid.setElement(x, y + 1, emitted);
    grid.setVisited(x, y);
    return true;
}

bool updateAir(Grid& grid, uint32_t x, uint32_t y)
{
    if (grid.countLiveNeighbours(x, y) == 3) {
        grid.setElement(x, y, Element::Life);
        return true;
    }
    return false;
}

bool updateLife(Grid& grid, uint32_t x, uint32_t y)
{
    const int live = grid.countLiveNeighbours(x, y);
    if (live < 2 || live > 3) {
        grid.setElement(x, y, Element::Air);
        return true;
    }
    return false;
}

} // namespace ElementRules
} // namespace FallingSand
