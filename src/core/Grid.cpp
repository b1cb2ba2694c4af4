#include "Grid.h"
#include "LoggingChannels.h"

#include <stdexcept>
#include <string>
#include <utility>

namespace FallingSand {

Grid::Grid(uint32_t width, uint32_t height, std::unique_ptr<RandomSource> random)
    : width_(width),
      height_(height),
      random_(random ? std::move(random) : makeRandomSource()),
      life_snapshot_(width, height)
{
    if (width < 2 || height < 2) {
        throw std::invalid_argument(
            "Grid dimensions must be at least 2x2, got " + std::to_string(width) + "x"
            + std::to_string(height));
    }

    cells_.resize(static_cast<size_t>(width_) * height_);
    setupBorder();

    LoggingChannels::grid()->debug("Grid created: {}x{}", width_, height_);
}

void Grid::setupBorder()
{
    for (uint32_t x = 0; x < width_; ++x) {
        setElement(x, 0, Element::Indestructible);
        setElement(x, height_ - 1, Element::Indestructible);
    }
    for (uint32_t y = 1; y + 1 < height_; ++y) {
        setElement(0, y, Element::Indestructible);
        setElement(width_ - 1, y, Element::Indestructible);
    }
}

void Grid::setElement(uint32_t x, uint32_t y, Element element, bool source)
{
    Cell& cell = cells_[index(x, y)];
    if (cell.isIndestructible()) {
        return;
    }

    const ElementProperties& props = getElementProperties(element);
    cell.element = element;
    cell.visited = visited_state_;
    cell.strength = props.strength;
    cell.source = source;
    if (props.randomize_color_factor > 0.0f) {
        cell.variant = static_cast<uint8_t>(random_->next(256));
    }
}

void Grid::swap(uint32_t x, uint32_t y, uint32_t x2, uint32_t y2)
{
    Cell& a = cells_[index(x, y)];
    Cell& b = cells_[index(x2, y2)];
    if (a.isIndestructible() || b.isIndestructible()) {
        return;
    }

    std::swap(a, b);
    a.visited = visited_state_;
    b.visited = visited_state_;
}

bool Grid::reduceStrength(uint32_t x, uint32_t y)
{
    Cell& cell = cells_[index(x, y)];
    if (cell.strength > 1) {
        cell.strength--;
        return true;
    }
    return false;
}

void Grid::clear()
{
    for (uint32_t y = 1; y + 1 < height_; ++y) {
        for (uint32_t x = 1; x + 1 < width_; ++x) {
            clearCell(x, y);
        }
    }
    life_snapshot_.clearAll();
    LoggingChannels::grid()->debug("Grid cleared");
}

uint32_t Grid::randomNeighbourX(uint32_t x)
{
    return random_->next(2) == 0 ? x + 1 : x - 1;
}

void Grid::setRandomSource(std::unique_ptr<RandomSource> random)
{
    if (!random) {
        throw std::invalid_argument("Grid::setRandomSource: random source must not be null");
    }
    random_ = std::move(random);
}

void Grid::captureLifeSnapshot()
{
    life_snapshot_.clearAll();
    for (uint32_t y = 1; y + 1 < height_; ++y) {
        for (uint32_t x = 1; x + 1 < width_; ++x) {
            if (cells_[index(x, y)].element == Element::Life) {
                life_snapshot_.set(x, y);
            }
        }
    }
}

int Grid::countLiveNeighbours(uint32_t x, uint32_t y) const
{
    return life_snapshot_.getNeighborhood3x3(x, y).countSetNeighbours();
}

} // namespace FallingSand
