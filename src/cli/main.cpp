#include "SimulationRunner.h"
#include "core/GridDiagramGenerator.h"
#include "core/LoggingChannels.h"
#include "core/SandboxConfig.h"

#include <args.hxx>
#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>

using namespace FallingSand;

namespace {

std::string getExamplesHelp()
{
    std::string examples = "Examples:\n\n";
    examples += "  falling-sand-cli --scenario sand_pile --size 64 --steps 200 --diagram\n";
    examples += "  falling-sand-cli --scenario glider --size 16 --seed 1 --steps 4 --diagram\n";
    examples += "  falling-sand-cli --config sandbox.json --print-stats\n";
    examples += "  falling-sand-cli --scenario water_drop --cell 32,62 -C rules:trace\n";
    return examples;
}

std::string getScenarioListHelp(const ScenarioRegistry& registry)
{
    std::ostringstream help;
    for (const auto& id : registry.getScenarioIds()) {
        const ScenarioMetadata* meta = registry.getMetadata(id);
        help << "  " << id << " - " << meta->description << "\n";
    }
    return help.str();
}

// Parse "x,y". Returns false on malformed input.
bool parseCellCoordinates(const std::string& text, int& x, int& y)
{
    std::istringstream in(text);
    char comma = 0;
    if (!(in >> x >> comma >> y) || comma != ',') {
        return false;
    }
    return in.eof() || in.peek() == std::char_traits<char>::eof();
}

} // namespace

int main(int argc, char** argv)
{
    args::ArgumentParser parser(
        "Falling Sand CLI",
        "Run the falling-sand simulation headlessly and print results as JSON.\n\n"
            + getExamplesHelp());

    args::HelpFlag help(parser, "help", "Display this help menu", { 'h', "help" });
    args::Flag verbose(parser, "verbose", "Enable debug logging", { 'v', "verbose" });

    args::ValueFlag<uint32_t> width(parser, "width", "Grid width in cells", { "width" });
    args::ValueFlag<uint32_t> height(parser, "height", "Grid height in cells", { "height" });
    args::ValueFlag<uint32_t> size(
        parser, "size", "Square grid size (overridden by --width/--height)", { "size" });
    args::ValueFlag<uint32_t> seed(parser, "seed", "Random seed for a reproducible run", { "seed" });
    args::ValueFlag<uint32_t> steps(
        parser, "steps", "Number of ticks to advance (default: 100)", { "steps" }, 100);
    args::ValueFlag<std::string> scenario(
        parser, "scenario", "Starting scenario id (default: empty)", { "scenario" });
    args::ValueFlag<std::string> configPath(
        parser, "config", "Sandbox config JSON file", { "config" });
    args::ValueFlag<std::string> logConfig(
        parser,
        "log-config",
        "Logging config JSON file (default: logging-config.json)",
        { "log-config" },
        "logging-config.json");
    args::ValueFlag<std::string> channels(
        parser,
        "channels",
        "Channel log levels, e.g. \"rules:trace,grid:debug\" or \"*:off\"",
        { 'C', "channels" });
    args::Flag diagram(parser, "diagram", "Print the final grid as ASCII", { "diagram" });
    args::Flag printStats(
        parser, "print-stats", "Print element counts and timers as JSON", { "print-stats" });
    args::ValueFlag<std::string> cell(
        parser, "x,y", "Print the final state of one cell as JSON", { "cell" });
    args::Flag listScenarios(
        parser, "list-scenarios", "List the built-in scenarios and exit", { "list-scenarios" });

    try {
        parser.ParseCLI(argc, argv);
    }
    catch (const args::Help&) {
        std::cout << parser;
        return 0;
    }
    catch (const args::ParseError& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << parser;
        return 1;
    }

    // Logs go to stderr and the log file; stdout is reserved for results.
    LoggingChannels::initializeFromConfig(args::get(logConfig));
    if (verbose) {
        LoggingChannels::configureFromString("*:debug");
    }
    if (channels) {
        LoggingChannels::configureFromString(args::get(channels));
    }

    Client::SimulationRunner runner;

    if (listScenarios) {
        std::cout << getScenarioListHelp(runner.getRegistry());
        return 0;
    }

    SandboxConfig config;
    if (configPath) {
        auto loaded = loadSandboxConfig(args::get(configPath));
        if (loaded.isError()) {
            std::cerr << "Error: " << loaded.errorValue() << std::endl;
            return 1;
        }
        config = loaded.value();
    }

    // Flags override the config file.
    if (size) {
        config.width = args::get(size);
        config.height = args::get(size);
    }
    if (width) config.width = args::get(width);
    if (height) config.height = args::get(height);
    if (seed) config.seed = args::get(seed);
    if (scenario) config.scenario = args::get(scenario);

    int cellX = 0;
    int cellY = 0;
    if (cell && !parseCellCoordinates(args::get(cell), cellX, cellY)) {
        std::cerr << "Error: --cell expects x,y but got '" << args::get(cell) << "'" << std::endl;
        return 1;
    }

    auto result = runner.run(config, args::get(steps));
    if (result.isError()) {
        std::cerr << "Error: " << result.errorValue() << std::endl;
        std::cerr << "Available scenarios:\n" << getScenarioListHelp(runner.getRegistry());
        return 1;
    }

    const World& world = *runner.getWorld();

    if (diagram) {
        std::cout << GridDiagramGenerator::generateAsciiDiagram(world.getGrid());
    }

    if (cell) {
        const Grid& grid = world.getGrid();
        if (cellX < 0 || cellY < 0 || cellX >= static_cast<int>(grid.getWidth())
            || cellY >= static_cast<int>(grid.getHeight())) {
            std::cerr << "Error: cell (" << cellX << "," << cellY << ") is outside the "
                      << grid.getWidth() << "x" << grid.getHeight() << " grid" << std::endl;
            return 1;
        }
        const Cell& inspected = grid.get(cellX, cellY);
        LoggingChannels::sim()->debug("Cell ({},{}): {}", cellX, cellY, inspected.toString());
        nlohmann::json cellJson = inspected.toJson();
        cellJson["x"] = cellX;
        cellJson["y"] = cellY;
        std::cout << cellJson.dump(2) << std::endl;
    }

    if (printStats || (!diagram && !cell)) {
        nlohmann::json output = result.value();
        if (!printStats) {
            output.erase("timer_stats");
            output.erase("stats");
        }
        std::cout << output.dump(2) << std::endl;
    }

    return 0;
}
