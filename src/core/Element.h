#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

/**
 * \file
 * Element kinds for the falling-sand grid and their static catalog properties.
 * Each cell holds exactly one element.
 */

namespace FallingSand {

enum class Element : uint8_t {
    Air = 0,     // Empty space (default).
    Sand,        // Granular solid, falls and piles.
    Rock,        // Static solid.
    Water,       // Liquid.
    Acid,        // Corrosive liquid.
    Drain,       // Removes adjacent liquids.
    Wood,        // Static flammable solid.
    Iron,        // Static solid that rusts.
    Rust,        // Granular product of rusting iron.
    Fire,        // Short-lived gas that ignites flammables.
    Ash,         // Granular product of burnt solids.
    Oil,         // Light flammable liquid.
    Lava,        // Hot liquid that cools to rock.
    Smoke,       // Short-lived gas.
    Life,        // Conway cell.
    Plant,       // Grows into water.
    WaterSource, // Emits water below.
    AcidSource,
    OilSource,
    FireSource,
    LavaSource,
    Indestructible // Border material, never changes.
};

constexpr size_t ELEMENT_COUNT = static_cast<size_t>(Element::Indestructible) + 1;

enum class ElementForm : uint8_t { Solid, Liquid, Gas, Special };

/**
 * Static properties that define how an element interacts with its neighbours.
 */
struct ElementProperties {
    const char* name;
    ElementForm form;
    uint8_t strength;             // Default strength when the element is placed.
    float randomize_color_factor; // > 0 draws a random variant on placement.
    bool burns;                   // Ignited by fire and lava.
    bool causes_rust;             // Rusts adjacent iron.
    bool grows_plant;             // Turned into plant by an adjacent plant.
    bool dissolves_in_acid;
    Element emits; // Element spawned below by a source kind, Air otherwise.
};

/**
 * Get catalog properties for an element.
 */
const ElementProperties& getElementProperties(Element element);

const char* getElementName(Element element);
ElementForm getElementForm(Element element);
uint8_t getElementStrength(Element element);

bool isElementLiquid(Element element);
bool elementBurns(Element element);
bool elementCausesRust(Element element);
bool elementGrowsPlant(Element element);
bool elementDissolvesInAcid(Element element);

/**
 * True for the *Source kinds that continuously emit another element.
 */
bool isSourceElement(Element element);

/**
 * Element a source kind emits. Returns Air for non-source kinds.
 */
Element getEmittedElement(Element element);

/**
 * Parse an element by its catalog name (case-insensitive). Returns false when unknown.
 */
bool parseElementName(const std::string& name, Element& element);

/**
 * JSON serialization support for Element (ADL convention for nlohmann::json).
 */
void to_json(nlohmann::json& j, Element element);
void from_json(const nlohmann::json& j, Element& element);

} // namespace FallingSand
