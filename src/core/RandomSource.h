#pragma once

#include <cstdint>
#include <memory>
#include <random>

namespace FallingSand {

/**
 * Uniform integer source used by the grid and the element rules.
 *
 * Kept abstract so tests can inject a fixed seed or a scripted sequence.
 */
class RandomSource {
public:
    virtual ~RandomSource() = default;

    // Draw uniformly from [0, max). max must be > 0.
    virtual uint32_t next(uint32_t max) = 0;

    virtual void seed(uint32_t value) = 0;
};

/**
 * Default source backed by std::mt19937.
 */
class MersenneRandomSource : public RandomSource {
public:
    // Seeded from std::random_device.
    MersenneRandomSource();
    explicit MersenneRandomSource(uint32_t seed);

    uint32_t next(uint32_t max) override;
    void seed(uint32_t value) override;

private:
    std::mt19937 engine_;
};

std::unique_ptr<RandomSource> makeRandomSource();
std::unique_ptr<RandomSource> makeRandomSource(uint32_t seed);

} // namespace FallingSand
