#pragma once

#include "Element.h"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace FallingSand {

class Grid;

enum class Tool : uint8_t { Pixel, Circle, Square, Spray, Fill };

const char* getToolName(Tool tool);

// Case-insensitive. Returns false when unknown.
bool parseToolName(const std::string& name, Tool& tool);

void to_json(nlohmann::json& j, Tool tool);
void from_json(const nlohmann::json& j, Tool& tool);

/**
 * Editing tools that stamp the selected element into a Grid.
 *
 * All writes go through Grid::setElement, so the border is never touched.
 * Shape cells that fall outside the interior are clipped.
 */
class ToolBox {
public:
    static constexpr int MIN_TOOL_SIZE = 1;
    static constexpr int MAX_TOOL_SIZE = 64;
    static constexpr int DEFAULT_TOOL_SIZE = 8;

    // Stamp the selected element with the selected tool centred on (x, y).
    void apply(Grid& grid, int x, int y);

    // Stamp Air with the selected tool's shape.
    void erase(Grid& grid, int x, int y);

    Element getElement() const { return element_; }
    void setElement(Element element) { element_ = element; }

    Tool getTool() const { return tool_; }
    void setTool(Tool tool) { tool_ = tool; }

    int getToolSize() const { return tool_size_; }

    // Clamped to [MIN_TOOL_SIZE, MAX_TOOL_SIZE].
    void setToolSize(int size);

private:
    void applyWith(Grid& grid, int x, int y, Element element);

    void paintPixel(Grid& grid, int x, int y, Element element);
    void paintCircle(Grid& grid, int x, int y, Element element);
    void paintSquare(Grid& grid, int x, int y, Element element);
    void paintSpray(Grid& grid, int x, int y, Element element);
    void floodFill(Grid& grid, int x, int y, Element element);

    Element element_ = Element::Sand;
    Tool tool_ = Tool::Circle;
    int tool_size_ = DEFAULT_TOOL_SIZE;
};

} // namespace FallingSand
