#pragma once

#include "Element.h"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace FallingSand {

/**
 * \file
 * Cell is the full mutable state of one grid position.
 *
 * Direct member access is public. Grid owns the invariants that involve sweep parity
 * (visited) and randomness (variant); use Grid::setElement() to place elements.
 */

struct Cell {
    Element element = Element::Air;
    uint8_t variant = 0;  // Cosmetic only, never used for logic.
    uint8_t strength = 0; // Decay, corrosion resistance or heat, depending on the element.
    bool visited = false; // Compared against Grid::isVisitedState().
    bool source = false;  // Continuously emitting spawner.

    const ElementProperties& properties() const;

    /**
     * Wear this cell down toward another element.
     *
     * While strength is above 1 it is decremented and the cell keeps its element.
     * Once strength can no longer decrease the cell becomes target, taking the target's
     * default strength (variant and flags are kept).
     *
     * @return true when the cell was converted.
     */
    bool dissolveTo(Element target);

    // Convenience queries.
    bool isAir() const { return element == Element::Air; }
    bool isIndestructible() const { return element == Element::Indestructible; }

    // Debug string representation.
    std::string toString() const;

    nlohmann::json toJson() const;
    static Cell fromJson(const nlohmann::json& json);
};

inline bool operator==(const Cell& a, const Cell& b)
{
    return a.element == b.element && a.variant == b.variant && a.strength == b.strength
        && a.visited == b.visited && a.source == b.source;
}

inline bool operator!=(const Cell& a, const Cell& b)
{
    return !(a == b);
}

/**
 * ADL (Argument-Dependent Lookup) functions for nlohmann::json automatic conversion.
 */
inline void to_json(nlohmann::json& j, const Cell& cell)
{
    j = cell.toJson();
}

inline void from_json(const nlohmann::json& j, Cell& cell)
{
    cell = Cell::fromJson(j);
}

} // namespace FallingSand
