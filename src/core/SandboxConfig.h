#pragma once

#include "Element.h"
#include "Result.h"
#include "ToolBox.h"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace FallingSand {

class World;

// Largest accepted grid width or height, in cells.
constexpr uint32_t MAX_GRID_DIMENSION = 1024;

/**
 * One tool stroke applied after the scenario has been set up.
 */
struct ToolPlacement {
    Element element = Element::Sand;
    Tool tool = Tool::Pixel;
    int size = 1;
    int x = 0;
    int y = 0;
};

/**
 * Describes how to build a starting World. Does not capture grid state.
 *
 * Example:
 *   {
 *     "width": 128, "height": 96, "seed": 42, "running": true,
 *     "scenario": "sand_pile",
 *     "placements": [ { "element": "Water", "tool": "Circle", "size": 10, "x": 20, "y": 10 } ]
 *   }
 */
struct SandboxConfig {
    uint32_t width = 256;
    uint32_t height = 256;
    std::optional<uint32_t> seed;
    bool running = true;
    std::string scenario = "empty";
    std::vector<ToolPlacement> placements;
};

void to_json(nlohmann::json& j, const ToolPlacement& placement);
void from_json(const nlohmann::json& j, ToolPlacement& placement);

void to_json(nlohmann::json& j, const SandboxConfig& config);
void from_json(const nlohmann::json& j, SandboxConfig& config);

// Check the grid dimensions are within [2, MAX_GRID_DIMENSION].
Result<std::monostate, std::string> validateSandboxConfig(const SandboxConfig& config);

// Parse and validate a config document.
Result<SandboxConfig, std::string> parseSandboxConfig(const std::string& text);

// Read, parse and validate a config file.
Result<SandboxConfig, std::string> loadSandboxConfig(const std::string& path);

// Stamp each placement through the world's toolbox. The toolbox selection is restored.
void applyPlacements(World& world, const std::vector<ToolPlacement>& placements);

} // namespace FallingSand
