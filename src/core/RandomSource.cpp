#include "RandomSource.h"

#include <cassert>

namespace FallingSand {

MersenneRandomSource::MersenneRandomSource() : engine_(std::random_device{}())
{}

MersenneRandomSource::MersenneRandomSource(uint32_t seed) : engine_(seed)
{}

uint32_t MersenneRandomSource::next(uint32_t max)
{
    assert(max > 0);
    std::uniform_int_distribution<uint32_t> dist(0, max - 1);
    return dist(engine_);
}

void MersenneRandomSource::seed(uint32_t value)
{
    engine_.seed(value);
}

std::unique_ptr<RandomSource> makeRandomSource()
{
    return std::make_unique<MersenneRandomSource>();
}

std::unique_ptr<RandomSource> makeRandomSource(uint32_t seed)
{
    return std::make_unique<MersenneRandomSource>(seed);
}

} // namespace FallingSand
