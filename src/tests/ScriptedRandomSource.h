#pragma once

#include "core/RandomSource.h"

#include <cstdint>
#include <utility>
#include <vector>

namespace FallingSand {

/**
 * RandomSource that replays a fixed script of draws for rule tests.
 *
 * Each next(max) returns the next scripted value modulo max. Once the script is
 * exhausted it keeps returning `fallback % max`. Every requested max is recorded,
 * which reveals the order in which rules consumed randomness.
 */
class ScriptedRandomSource : public RandomSource {
public:
    explicit ScriptedRandomSource(std::vector<uint32_t> script = {}, uint32_t fallback = 0)
        : script_(std::move(script)), fallback_(fallback)
    {}

    uint32_t next(uint32_t max) override
    {
        requested_.push_back(max);
        const uint32_t value = position_ < script_.size() ? script_[position_++] : fallback_;
        return value % max;
    }

    void seed(uint32_t /*value*/) override { position_ = 0; }

    const std::vector<uint32_t>& requested() const { return requested_; }
    size_t consumed() const { return position_; }

private:
    std::vector<uint32_t> script_;
    uint32_t fallback_;
    size_t position_ = 0;
    std::vector<uint32_t> requested_;
};

} // namespace FallingSand
