#include "World.h"
#include "LoggingChannels.h"
#include "ScopeTimer.h"

#include <string>

namespace FallingSand {

World::World(uint32_t width, uint32_t height, std::optional<uint32_t> seed)
    : seed_(seed),
      grid_(std::make_unique<Grid>(width, height, makeSeededSource())),
      scheduler_(timers_)
{
    LoggingChannels::sim()->info(
        "Creating World: {}x{} grid{}",
        width,
        height,
        seed_ ? " (seed " + std::to_string(*seed_) + ")" : "");
}

World::~World()
{
    LoggingChannels::sim()->debug(
        "Destroying World: {}x{} grid after {} ticks", getWidth(), getHeight(), state_.ticks);
}

bool World::advanceTick()
{
    ScopeTimer timer(timers_, "advance_tick");
    return scheduler_.advanceTick(*grid_, state_);
}

void World::setRunning(bool running)
{
    if (state_.running != running) {
        LoggingChannels::sim()->debug("Simulation {}", running ? "resumed" : "paused");
    }
    state_.running = running;
}

void World::clear()
{
    LoggingChannels::sim()->info("Clearing World");
    grid_->clear();
}

void World::resize(uint32_t width, uint32_t height)
{
    LoggingChannels::sim()->info(
        "Resizing World: {}x{} -> {}x{}", getWidth(), getHeight(), width, height);
    grid_ = std::make_unique<Grid>(width, height, makeSeededSource());
}

void World::setRandomSeed(uint32_t seed)
{
    seed_ = seed;
    grid_->setRandomSource(makeRandomSource(seed));
    LoggingChannels::sim()->debug("World RNG seed set to {}", seed);
}

std::unique_ptr<RandomSource> World::makeSeededSource() const
{
    return seed_ ? makeRandomSource(*seed_) : makeRandomSource();
}

} // namespace FallingSand
