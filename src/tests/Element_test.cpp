#include "core/Cell.h"
#include "core/Element.h"

#include <gtest/gtest.h>
#include <set>
#include <stdexcept>
#include <string>

using namespace FallingSand;

namespace {

Element elementAt(size_t index)
{
    return static_cast<Element>(index);
}

} // namespace

TEST(ElementTest, NamesAreUnique)
{
    std::set<std::string> names;
    for (size_t i = 0; i < ELEMENT_COUNT; ++i) {
        EXPECT_TRUE(names.insert(getElementName(elementAt(i))).second)
            << "Duplicate name: " << getElementName(elementAt(i));
    }
    EXPECT_EQ(names.size(), ELEMENT_COUNT);
}

TEST(ElementTest, JsonRoundTripCoversCatalog)
{
    for (size_t i = 0; i < ELEMENT_COUNT; ++i) {
        const Element element = elementAt(i);
        nlohmann::json j = element;
        ASSERT_TRUE(j.is_string());
        EXPECT_EQ(j.get<std::string>(), getElementName(element));
        EXPECT_EQ(j.get<Element>(), element);
    }
}

TEST(ElementTest, FromJsonRejectsUnknownAndNonString)
{
    EXPECT_THROW(nlohmann::json("Plasma").get<Element>(), std::runtime_error);
    EXPECT_THROW(nlohmann::json(3).get<Element>(), std::runtime_error);
}

TEST(ElementTest, ParseIsCaseInsensitive)
{
    Element element = Element::Air;
    EXPECT_TRUE(parseElementName("water", element));
    EXPECT_EQ(element, Element::Water);
    EXPECT_TRUE(parseElementName("LAVASOURCE", element));
    EXPECT_EQ(element, Element::LavaSource);

    element = Element::Sand;
    EXPECT_FALSE(parseElementName("mud", element));
    EXPECT_EQ(element, Element::Sand);

    // High-bit bytes are compared as unsigned and never match.
    EXPECT_FALSE(parseElementName("W\xC3\xA4ter", element));
    EXPECT_FALSE(parseElementName("\xFF", element));
    EXPECT_EQ(element, Element::Sand);
}

TEST(ElementTest, SourcesEmitTheirElement)
{
    EXPECT_EQ(getEmittedElement(Element::WaterSource), Element::Water);
    EXPECT_EQ(getEmittedElement(Element::AcidSource), Element::Acid);
    EXPECT_EQ(getEmittedElement(Element::OilSource), Element::Oil);
    EXPECT_EQ(getEmittedElement(Element::FireSource), Element::Fire);
    EXPECT_EQ(getEmittedElement(Element::LavaSource), Element::Lava);

    EXPECT_TRUE(isSourceElement(Element::FireSource));
    EXPECT_FALSE(isSourceElement(Element::Fire));
    EXPECT_FALSE(isSourceElement(Element::Air));
    EXPECT_EQ(getEmittedElement(Element::Sand), Element::Air);
}

TEST(ElementTest, CatalogFlags)
{
    EXPECT_TRUE(isElementLiquid(Element::Water));
    EXPECT_TRUE(isElementLiquid(Element::Acid));
    EXPECT_TRUE(isElementLiquid(Element::Oil));
    EXPECT_TRUE(isElementLiquid(Element::Lava));
    EXPECT_FALSE(isElementLiquid(Element::Sand));

    EXPECT_TRUE(elementBurns(Element::Wood));
    EXPECT_TRUE(elementBurns(Element::Oil));
    EXPECT_TRUE(elementBurns(Element::Plant));
    EXPECT_FALSE(elementBurns(Element::Rock));

    EXPECT_TRUE(elementCausesRust(Element::Water));
    EXPECT_TRUE(elementCausesRust(Element::Acid));
    EXPECT_TRUE(elementGrowsPlant(Element::Water));

    EXPECT_TRUE(elementDissolvesInAcid(Element::Sand));
    EXPECT_FALSE(elementDissolvesInAcid(Element::Iron));
    EXPECT_FALSE(elementDissolvesInAcid(Element::Indestructible));
}

TEST(CellTest, DefaultIsAir)
{
    Cell cell;
    EXPECT_TRUE(cell.isAir());
    EXPECT_EQ(cell.strength, 0);
    EXPECT_FALSE(cell.visited);
    EXPECT_FALSE(cell.source);
}

TEST(CellTest, DissolveToWearsDownThenConverts)
{
    Cell cell;
    cell.element = Element::Sand;
    cell.strength = 3;
    cell.variant = 42;

    EXPECT_FALSE(cell.dissolveTo(Element::Air));
    EXPECT_EQ(cell.strength, 2);
    EXPECT_FALSE(cell.dissolveTo(Element::Air));
    EXPECT_EQ(cell.strength, 1);
    EXPECT_EQ(cell.element, Element::Sand);

    EXPECT_TRUE(cell.dissolveTo(Element::Rust));
    EXPECT_EQ(cell.element, Element::Rust);
    EXPECT_EQ(cell.strength, getElementStrength(Element::Rust));
    EXPECT_EQ(cell.variant, 42);
}

TEST(CellTest, ToStringDescribesEveryField)
{
    Cell cell;
    cell.element = Element::WaterSource;
    cell.variant = 7;
    cell.strength = 3;
    cell.visited = true;
    cell.source = true;

    EXPECT_EQ(cell.toString(), "WaterSource(variant=7, strength=3, visited=1, source=1)");
}

TEST(CellTest, JsonRoundTrip)
{
    Cell cell;
    cell.element = Element::OilSource;
    cell.variant = 7;
    cell.strength = 3;
    cell.visited = true;
    cell.source = true;

    nlohmann::json j = cell;
    EXPECT_EQ(j["element"], "OilSource");
    EXPECT_EQ(j.get<Cell>(), cell);
}

TEST(CellTest, FromJsonDefaultsStrengthToCatalog)
{
    const Cell cell = nlohmann::json{ { "element", "Iron" } }.get<Cell>();
    EXPECT_EQ(cell.element, Element::Iron);
    EXPECT_EQ(cell.strength, getElementStrength(Element::Iron));
    EXPECT_FALSE(cell.source);

    EXPECT_THROW(nlohmann::json::array().get<Cell>(), std::runtime_error);
}
