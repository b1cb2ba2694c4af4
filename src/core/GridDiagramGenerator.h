#pragma once

#include "Element.h"

#include <string>

namespace FallingSand {

class Grid;

/**
 * @brief Renders a Grid as plain text for debugging and tests.
 *
 * One character per cell and one line per row, border included:
 *
 *   #####
 *   #  .#
 *   #~~w#
 *   #####
 */
class GridDiagramGenerator {
public:
    static std::string generateAsciiDiagram(const Grid& grid);

    static char elementToChar(Element element);
};

} // namespace FallingSand
