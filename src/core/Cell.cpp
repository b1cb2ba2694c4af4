#include "Cell.h"

#include <sstream>
#include <stdexcept>
#include <string>

using namespace FallingSand;

const ElementProperties& Cell::properties() const
{
    return getElementProperties(element);
}

bool Cell::dissolveTo(Element target)
{
    if (strength > 1) {
        strength--;
        return false;
    }

    element = target;
    strength = getElementStrength(target);
    return true;
}

std::string Cell::toString() const
{
    std::ostringstream oss;
    oss << getElementName(element) << "(variant=" << static_cast<int>(variant)
        << ", strength=" << static_cast<int>(strength) << ", visited=" << visited
        << ", source=" << source << ")";
    return oss.str();
}

nlohmann::json Cell::toJson() const
{
    return nlohmann::json{ { "element", element },
                           { "variant", variant },
                           { "strength", strength },
                           { "visited", visited },
                           { "source", source } };
}

Cell Cell::fromJson(const nlohmann::json& json)
{
    if (!json.is_object()) {
        throw std::runtime_error("Cell::fromJson: JSON value must be an object");
    }

    Cell cell;
    cell.element = json.at("element").get<Element>();
    cell.variant = json.value("variant", static_cast<uint8_t>(0));
    cell.strength = json.value("strength", getElementStrength(cell.element));
    cell.visited = json.value("visited", false);
    cell.source = json.value("source", false);
    return cell;
}
