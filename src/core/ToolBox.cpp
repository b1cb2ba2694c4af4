#include "ToolBox.h"
#include "Grid.h"
#include "LoggingChannels.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <queue>
#include <stdexcept>
#include <utility>
#include <vector>

namespace FallingSand {

namespace {

constexpr std::array<const char*, 5> TOOL_NAMES = { "Pixel", "Circle", "Square", "Spray", "Fill" };

// Spray writes roughly one in this many cells of its circle.
constexpr uint32_t SPRAY_DENSITY = 8;

bool equalsIgnoreCase(const std::string& a, const char* b)
{
    const std::string other(b);
    return a.size() == other.size()
        && std::equal(a.begin(), a.end(), other.begin(), [](char l, char r) {
               return std::tolower(static_cast<unsigned char>(l))
                   == std::tolower(static_cast<unsigned char>(r));
           });
}

} // namespace

const char* getToolName(Tool tool)
{
    return TOOL_NAMES[static_cast<size_t>(tool)];
}

bool parseToolName(const std::string& name, Tool& tool)
{
    for (size_t i = 0; i < TOOL_NAMES.size(); ++i) {
        if (equalsIgnoreCase(name, TOOL_NAMES[i])) {
            tool = static_cast<Tool>(i);
            return true;
        }
    }
    return false;
}

void to_json(nlohmann::json& j, Tool tool)
{
    j = getToolName(tool);
}

void from_json(const nlohmann::json& j, Tool& tool)
{
    if (!j.is_string()) {
        throw std::runtime_error("Tool::from_json: JSON value must be a string");
    }
    const std::string name = j.get<std::string>();
    if (!parseToolName(name, tool)) {
        throw std::runtime_error("Tool::from_json: unknown tool '" + name + "'");
    }
}

void ToolBox::setToolSize(int size)
{
    tool_size_ = std::clamp(size, MIN_TOOL_SIZE, MAX_TOOL_SIZE);
}

void ToolBox::apply(Grid& grid, int x, int y)
{
    applyWith(grid, x, y, element_);
}

void ToolBox::erase(Grid& grid, int x, int y)
{
    applyWith(grid, x, y, Element::Air);
}

void ToolBox::applyWith(Grid& grid, int x, int y, Element element)
{
    LoggingChannels::tools()->trace(
        "{} {} at ({},{}) size {}", getToolName(tool_), getElementName(element), x, y, tool_size_);

    switch (tool_) {
        case Tool::Pixel:
            paintPixel(grid, x, y, element);
            break;
        case Tool::Circle:
            paintCircle(grid, x, y, element);
            break;
        case Tool::Square:
            paintSquare(grid, x, y, element);
            break;
        case Tool::Spray:
            paintSpray(grid, x, y, element);
            break;
        case Tool::Fill:
            floodFill(grid, x, y, element);
            break;
    }
}

void ToolBox::paintPixel(Grid& grid, int x, int y, Element element)
{
    if (grid.isInterior(x, y)) {
        grid.setElement(x, y, element, isSourceElement(element));
    }
}

void ToolBox::paintCircle(Grid& grid, int x, int y, Element element)
{
    const int radius = tool_size_ / 2;
    for (int dy = -radius; dy <= radius; ++dy) {
        for (int dx = -radius; dx <= radius; ++dx) {
            if (dx * dx + dy * dy <= radius * radius) {
                paintPixel(grid, x + dx, y + dy, element);
            }
        }
    }
}

void ToolBox::paintSquare(Grid& grid, int x, int y, Element element)
{
    const int left = x - tool_size_ / 2;
    const int top = y - tool_size_ / 2;
    for (int yy = top; yy < top + tool_size_; ++yy) {
        for (int xx = left; xx < left + tool_size_; ++xx) {
            paintPixel(grid, xx, yy, element);
        }
    }
}

void ToolBox::paintSpray(Grid& grid, int x, int y, Element element)
{
    const int radius = tool_size_ / 2;
    for (int dy = -radius; dy <= radius; ++dy) {
        for (int dx = -radius; dx <= radius; ++dx) {
            if (dx * dx + dy * dy <= radius * radius && grid.random(SPRAY_DENSITY) == 0) {
                paintPixel(grid, x + dx, y + dy, element);
            }
        }
    }
}

void ToolBox::floodFill(Grid& grid, int x, int y, Element element)
{
    if (!grid.isInterior(x, y)) {
        return;
    }

    const Element target = grid.get(x, y).element;
    if (target == element || target == Element::Indestructible) {
        return;
    }

    const bool source = isSourceElement(element);
    std::vector<bool> queued(static_cast<size_t>(grid.getWidth()) * grid.getHeight(), false);
    std::queue<std::pair<int, int>> pending;

    auto enqueue = [&](int px, int py) {
        if (!grid.isInterior(px, py)) return;
        const size_t idx = static_cast<size_t>(px) + static_cast<size_t>(py) * grid.getWidth();
        if (queued[idx] || grid.get(px, py).element != target) return;
        queued[idx] = true;
        pending.emplace(px, py);
    };

    enqueue(x, y);
    size_t filled = 0;
    while (!pending.empty()) {
        const auto [cx, cy] = pending.front();
        pending.pop();

        grid.setElement(cx, cy, element, source);
        filled++;

        enqueue(cx + 1, cy);
        enqueue(cx - 1, cy);
        enqueue(cx, cy + 1);
        enqueue(cx, cy - 1);
    }

    LoggingChannels::tools()->debug(
        "Filled {} cells of {} with {}", filled, getElementName(target), getElementName(element));
}

} // namespace FallingSand
