#pragma once

#include <chrono>
#include <cstdint>
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <unordered_map>
#include <vector>

namespace FallingSand {

/**
 * Named wall-clock timers that accumulate milliseconds across start/stop pairs.
 * The scheduler records "sweep"; World records "advance_tick".
 */
class Timers {
public:
    Timers() = default;
    ~Timers() = default;

    void startTimer(const std::string& name);

    // Stop a timer and return its accumulated time in milliseconds, -1 if unknown.
    double stopTimer(const std::string& name);

    bool hasTimer(const std::string& name) const;

    // Includes the running session if the timer is currently started.
    double getAccumulatedTime(const std::string& name) const;

    void resetTimer(const std::string& name);

    uint32_t getCallCount(const std::string& name) const;

    void resetCallCount(const std::string& name);

    // Log a summary of every timer through the "sim" channel.
    void dumpTimerStats() const;
    std::vector<std::string> getAllTimerNames() const;

    nlohmann::json exportAllTimersAsJson() const;

private:
    using TimePoint = std::chrono::steady_clock::time_point;

    struct TimerData {
        TimePoint startTime;
        double accumulatedTime = 0.0;
        bool isRunning = false;
        uint32_t callCount = 0;
    };

    std::unordered_map<std::string, TimerData> timers_;
};

} // namespace FallingSand
