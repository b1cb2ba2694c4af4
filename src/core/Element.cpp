#include "Element.h"

#include <algorithm>
#include <array>
#include <cassert>
#include <cctype>
#include <cstddef>
#include <stdexcept>
#include <string>

namespace FallingSand {

// Element catalog, indexed by Element value.
static const std::array<ElementProperties, ELEMENT_COUNT> ELEMENT_PROPERTIES = {
    { // ========== AIR ==========
      { .name = "Air",
        .form = ElementForm::Gas,
        .strength = 0,
        .randomize_color_factor = 0.0f,
        .burns = false,
        .causes_rust = false,
        .grows_plant = false,
        .dissolves_in_acid = false,
        .emits = Element::Air },

      // ========== SAND ==========
      { .name = "Sand",
        .form = ElementForm::Solid,
        .strength = 8,
        .randomize_color_factor = 0.1f,
        .burns = false,
        .causes_rust = false,
        .grows_plant = false,
        .dissolves_in_acid = true,
        .emits = Element::Air },

      // ========== ROCK ==========
      { .name = "Rock",
        .form = ElementForm::Solid,
        .strength = 24,
        .randomize_color_factor = 0.2f,
        .burns = false,
        .causes_rust = false,
        .grows_plant = false,
        .dissolves_in_acid = true,
        .emits = Element::Air },

      // ========== WATER ==========
      { .name = "Water",
        .form = ElementForm::Liquid,
        .strength = 0,
        .randomize_color_factor = 0.0f,
        .burns = false,
        .causes_rust = true,
        .grows_plant = true,
        .dissolves_in_acid = false,
        .emits = Element::Air },

      // ========== ACID ==========
      // Strength is how many water contacts it takes to dilute.
      { .name = "Acid",
        .form = ElementForm::Liquid,
        .strength = 8,
        .randomize_color_factor = 0.0f,
        .burns = false,
        .causes_rust = true,
        .grows_plant = false,
        .dissolves_in_acid = false,
        .emits = Element::Air },

      // ========== DRAIN ==========
      { .name = "Drain",
        .form = ElementForm::Special,
        .strength = 0,
        .randomize_color_factor = 0.0f,
        .burns = false,
        .causes_rust = false,
        .grows_plant = false,
        .dissolves_in_acid = false,
        .emits = Element::Air },

      // ========== WOOD ==========
      { .name = "Wood",
        .form = ElementForm::Solid,
        .strength = 16,
        .randomize_color_factor = 0.1f,
        .burns = true,
        .causes_rust = false,
        .grows_plant = false,
        .dissolves_in_acid = true,
        .emits = Element::Air },

      // ========== IRON ==========
      // Strength counts down while a rusting neighbour is present.
      { .name = "Iron",
        .form = ElementForm::Solid,
        .strength = 64,
        .randomize_color_factor = 0.05f,
        .burns = false,
        .causes_rust = false,
        .grows_plant = false,
        .dissolves_in_acid = false,
        .emits = Element::Air },

      // ========== RUST ==========
      { .name = "Rust",
        .form = ElementForm::Solid,
        .strength = 8,
        .randomize_color_factor = 0.2f,
        .burns = false,
        .causes_rust = false,
        .grows_plant = false,
        .dissolves_in_acid = true,
        .emits = Element::Air },

      // ========== FIRE ==========
      // Strength is the remaining burn time.
      { .name = "Fire",
        .form = ElementForm::Gas,
        .strength = 16,
        .randomize_color_factor = 0.5f,
        .burns = false,
        .causes_rust = false,
        .grows_plant = false,
        .dissolves_in_acid = false,
        .emits = Element::Air },

      // ========== ASH ==========
      { .name = "Ash",
        .form = ElementForm::Solid,
        .strength = 2,
        .randomize_color_factor = 0.2f,
        .burns = false,
        .causes_rust = false,
        .grows_plant = false,
        .dissolves_in_acid = true,
        .emits = Element::Air },

      // ========== OIL ==========
      { .name = "Oil",
        .form = ElementForm::Liquid,
        .strength = 4,
        .randomize_color_factor = 0.05f,
        .burns = true,
        .causes_rust = false,
        .grows_plant = false,
        .dissolves_in_acid = false,
        .emits = Element::Air },

      // ========== LAVA ==========
      // Strength is heat. Below 64 the lava starts to cool on its own.
      { .name = "Lava",
        .form = ElementForm::Liquid,
        .strength = 96,
        .randomize_color_factor = 0.3f,
        .burns = false,
        .causes_rust = false,
        .grows_plant = false,
        .dissolves_in_acid = false,
        .emits = Element::Air },

      // ========== SMOKE ==========
      { .name = "Smoke",
        .form = ElementForm::Gas,
        .strength = 8,
        .randomize_color_factor = 0.3f,
        .burns = false,
        .causes_rust = false,
        .grows_plant = false,
        .dissolves_in_acid = false,
        .emits = Element::Air },

      // ========== LIFE ==========
      { .name = "Life",
        .form = ElementForm::Special,
        .strength = 0,
        .randomize_color_factor = 0.0f,
        .burns = false,
        .causes_rust = false,
        .grows_plant = false,
        .dissolves_in_acid = false,
        .emits = Element::Air },

      // ========== PLANT ==========
      { .name = "Plant",
        .form = ElementForm::Solid,
        .strength = 4,
        .randomize_color_factor = 0.2f,
        .burns = true,
        .causes_rust = false,
        .grows_plant = false,
        .dissolves_in_acid = true,
        .emits = Element::Air },

      // ========== SOURCES ==========
      { .name = "WaterSource",
        .form = ElementForm::Special,
        .strength = 0,
        .randomize_color_factor = 0.0f,
        .burns = false,
        .causes_rust = false,
        .grows_plant = false,
        .dissolves_in_acid = false,
        .emits = Element::Water },
      { .name = "AcidSource",
        .form = ElementForm::Special,
        .strength = 0,
        .randomize_color_factor = 0.0f,
        .burns = false,
        .causes_rust = false,
        .grows_plant = false,
        .dissolves_in_acid = false,
        .emits = Element::Acid },
      { .name = "OilSource",
        .form = ElementForm::Special,
        .strength = 0,
        .randomize_color_factor = 0.0f,
        .burns = false,
        .causes_rust = false,
        .grows_plant = false,
        .dissolves_in_acid = false,
        .emits = Element::Oil },
      { .name = "FireSource",
        .form = ElementForm::Special,
        .strength = 0,
        .randomize_color_factor = 0.0f,
        .burns = false,
        .causes_rust = false,
        .grows_plant = false,
        .dissolves_in_acid = false,
        .emits = Element::Fire },
      { .name = "LavaSource",
        .form = ElementForm::Special,
        .strength = 0,
        .randomize_color_factor = 0.0f,
        .burns = false,
        .causes_rust = false,
        .grows_plant = false,
        .dissolves_in_acid = false,
        .emits = Element::Lava },

      // ========== INDESTRUCTIBLE ==========
      { .name = "Indestructible",
        .form = ElementForm::Special,
        .strength = 0,
        .randomize_color_factor = 0.0f,
        .burns = false,
        .causes_rust = false,
        .grows_plant = false,
        .dissolves_in_acid = false,
        .emits = Element::Air } }
};

const ElementProperties& getElementProperties(Element element)
{
    const auto index = static_cast<size_t>(element);
    assert(index < ELEMENT_PROPERTIES.size());
    return ELEMENT_PROPERTIES[index];
}

const char* getElementName(Element element)
{
    return getElementProperties(element).name;
}

ElementForm getElementForm(Element element)
{
    return getElementProperties(element).form;
}

uint8_t getElementStrength(Element element)
{
    return getElementProperties(element).strength;
}

bool isElementLiquid(Element element)
{
    return getElementProperties(element).form == ElementForm::Liquid;
}

bool elementBurns(Element element)
{
    return getElementProperties(element).burns;
}

bool elementCausesRust(Element element)
{
    return getElementProperties(element).causes_rust;
}

bool elementGrowsPlant(Element element)
{
    return getElementProperties(element).grows_plant;
}

bool elementDissolvesInAcid(Element element)
{
    return getElementProperties(element).dissolves_in_acid;
}

bool isSourceElement(Element element)
{
    return getElementProperties(element).emits != Element::Air;
}

Element getEmittedElement(Element element)
{
    return getElementProperties(element).emits;
}

bool parseElementName(const std::string& name, Element& element)
{
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    // Linear search through element names.
    for (size_t i = 0; i < ELEMENT_PROPERTIES.size(); ++i) {
        std::string candidate = ELEMENT_PROPERTIES[i].name;
        std::transform(
            candidate.begin(), candidate.end(), candidate.begin(), [](unsigned char c) {
                return static_cast<char>(std::tolower(c));
            });
        if (lower == candidate) {
            element = static_cast<Element>(i);
            return true;
        }
    }
    return false;
}

void to_json(nlohmann::json& j, Element element)
{
    j = getElementName(element);
}

void from_json(const nlohmann::json& j, Element& element)
{
    if (!j.is_string()) {
        throw std::runtime_error("Element::from_json: JSON value must be a string");
    }

    std::string name = j.get<std::string>();
    if (!parseElementName(name, element)) {
        throw std::runtime_error("Element::from_json: Unknown element '" + name + "'");
    }
}

} // namespace FallingSand
