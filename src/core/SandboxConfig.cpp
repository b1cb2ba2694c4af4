#include "SandboxConfig.h"
#include "LoggingChannels.h"
#include "World.h"

#include <cstdint>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace FallingSand {

namespace {

// Read as signed so a negative value is rejected instead of wrapping.
uint32_t readDimension(const nlohmann::json& j, const std::string& key, uint32_t fallback)
{
    if (!j.contains(key)) {
        return fallback;
    }
    const int64_t value = j.at(key).get<int64_t>();
    if (value < 0) {
        throw std::runtime_error(
            "SandboxConfig::from_json: '" + key + "' must not be negative, got "
            + std::to_string(value));
    }
    if (value > MAX_GRID_DIMENSION) {
        throw std::runtime_error(
            "SandboxConfig::from_json: '" + key + "' exceeds "
            + std::to_string(MAX_GRID_DIMENSION) + ", got " + std::to_string(value));
    }
    return static_cast<uint32_t>(value);
}

} // namespace

void to_json(nlohmann::json& j, const ToolPlacement& placement)
{
    j = nlohmann::json{ { "element", placement.element },
                        { "tool", placement.tool },
                        { "size", placement.size },
                        { "x", placement.x },
                        { "y", placement.y } };
}

void from_json(const nlohmann::json& j, ToolPlacement& placement)
{
    if (!j.is_object()) {
        throw std::runtime_error("ToolPlacement::from_json: JSON value must be an object");
    }
    if (!j.contains("x") || !j.contains("y")) {
        throw std::runtime_error("ToolPlacement::from_json: 'x' and 'y' are required");
    }

    placement.element = j.value("element", Element::Sand);
    placement.tool = j.value("tool", Tool::Pixel);
    placement.size = j.value("size", 1);
    placement.x = j.at("x").get<int>();
    placement.y = j.at("y").get<int>();
}

void to_json(nlohmann::json& j, const SandboxConfig& config)
{
    j = nlohmann::json{ { "width", config.width },
                        { "height", config.height },
                        { "running", config.running },
                        { "scenario", config.scenario },
                        { "placements", config.placements } };
    if (config.seed) {
        j["seed"] = *config.seed;
    }
}

void from_json(const nlohmann::json& j, SandboxConfig& config)
{
    if (!j.is_object()) {
        throw std::runtime_error("SandboxConfig::from_json: JSON value must be an object");
    }

    config = SandboxConfig{};
    config.width = readDimension(j, "width", config.width);
    config.height = readDimension(j, "height", config.height);
    if (j.contains("seed") && !j["seed"].is_null()) {
        config.seed = j["seed"].get<uint32_t>();
    }
    config.running = j.value("running", config.running);
    config.scenario = j.value("scenario", config.scenario);
    if (j.contains("placements")) {
        config.placements = j["placements"].get<std::vector<ToolPlacement>>();
    }
}

Result<std::monostate, std::string> validateSandboxConfig(const SandboxConfig& config)
{
    using ResultT = Result<std::monostate, std::string>;

    if (config.width < 2 || config.height < 2) {
        return ResultT::error(
            "grid must be at least 2x2, got " + std::to_string(config.width) + "x"
            + std::to_string(config.height));
    }
    if (config.width > MAX_GRID_DIMENSION || config.height > MAX_GRID_DIMENSION) {
        return ResultT::error(
            "grid must be at most " + std::to_string(MAX_GRID_DIMENSION) + "x"
            + std::to_string(MAX_GRID_DIMENSION) + ", got " + std::to_string(config.width) + "x"
            + std::to_string(config.height));
    }
    return ResultT::okay();
}

Result<SandboxConfig, std::string> parseSandboxConfig(const std::string& text)
{
    using ResultT = Result<SandboxConfig, std::string>;

    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(text);
    }
    catch (const nlohmann::json::parse_error& e) {
        return ResultT::error(std::string("JSON parse error: ") + e.what());
    }

    SandboxConfig config;
    try {
        config = doc.get<SandboxConfig>();
    }
    catch (const nlohmann::json::exception& e) {
        return ResultT::error(std::string("Invalid sandbox config: ") + e.what());
    }
    catch (const std::runtime_error& e) {
        return ResultT::error(std::string("Invalid sandbox config: ") + e.what());
    }

    auto valid = validateSandboxConfig(config);
    if (valid.isError()) {
        return ResultT::error("Invalid sandbox config: " + valid.errorValue());
    }

    return ResultT::okay(std::move(config));
}

Result<SandboxConfig, std::string> loadSandboxConfig(const std::string& path)
{
    std::ifstream file(path);
    if (!file.is_open()) {
        LoggingChannels::config()->error("Cannot open sandbox config: {}", path);
        return Result<SandboxConfig, std::string>::error("Cannot open config file: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto result = parseSandboxConfig(buffer.str());
    if (result.isError()) {
        LoggingChannels::config()->error("{}: {}", path, result.errorValue());
        return result;
    }

    const SandboxConfig& config = result.value();
    LoggingChannels::config()->info(
        "Loaded sandbox config {}: {}x{}, scenario '{}', {} placements",
        path,
        config.width,
        config.height,
        config.scenario,
        config.placements.size());
    return result;
}

void applyPlacements(World& world, const std::vector<ToolPlacement>& placements)
{
    ToolBox& tools = world.getToolBox();
    const ToolBox saved = tools;

    for (const auto& placement : placements) {
        tools.setElement(placement.element);
        tools.setTool(placement.tool);
        tools.setToolSize(placement.size);
        world.applyTool(placement.x, placement.y);
    }

    tools = saved;
}

} // namespace FallingSand
