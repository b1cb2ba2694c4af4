#pragma once

#include "Element.h"

#include <cstdint>
#include <optional>

namespace FallingSand {

class Grid;

/**
 * Per-element update rules, one function per element kind.
 *
 * Each rule processes the cell at (x, y), which must be interior. The return value
 * tells the scheduler whether the origin cell was consumed (moved or transformed and
 * already stamped with the current parity). On false the scheduler stamps it.
 */
namespace ElementRules {

// Sand, Rust and Ash: fall, slide diagonally, dissolve in acid.
bool updateSand(Grid& grid, uint32_t x, uint32_t y);
bool updateAsh(Grid& grid, uint32_t x, uint32_t y);

// Water: fall or flow sideways up to 15 cells.
bool updateWater(Grid& grid, uint32_t x, uint32_t y);

/**
 * Water touching the cell at (otherX, otherY).
 * @param draw The water's direction draw, used for the acid pass-through roll.
 * @return std::nullopt when the touched element does not react with water.
 */
std::optional<bool> touchWater(
    Grid& grid, uint32_t waterX, uint32_t waterY, uint32_t otherX, uint32_t otherY, uint32_t draw);

bool updateAcid(Grid& grid, uint32_t x, uint32_t y);
bool updateOil(Grid& grid, uint32_t x, uint32_t y);
bool updateDrain(Grid& grid, uint32_t x, uint32_t y);
bool updateFire(Grid& grid, uint32_t x, uint32_t y);

bool updateLava(Grid& grid, uint32_t x, uint32_t y);

// Lava touching (otherX, otherY). std::nullopt when nothing reacts.
std::optional<bool> touchLava(
    Grid& grid, uint32_t lavaX, uint32_t lavaY, uint32_t otherX, uint32_t otherY);

bool updateSmoke(Grid& grid, uint32_t x, uint32_t y);
bool updateIron(Grid& grid, uint32_t x, uint32_t y);
bool updatePlant(Grid& grid, uint32_t x, uint32_t y);

// Any *Source kind: emit into the cell below unless it already holds the emitted element.
bool updateSource(Grid& grid, uint32_t x, uint32_t y, Element emitted);

// Conway birth and death, counted from the tick-start Life snapshot.
bool updateAir(Grid& grid, uint32_t x, uint32_t y);
bool updateLife(Grid& grid, uint32_t x, uint32_t y);

} // namespace ElementRules

} // namespace FallingSand
