#include "Timers.h"
#include "LoggingChannels.h"

#include <algorithm>
#include <nlohmann/json.hpp>

namespace FallingSand {

namespace {

double elapsedMs(std::chrono::steady_clock::time_point start)
{
    const auto duration = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start);
    return duration.count() / 1000.0;
}

} // namespace

void Timers::startTimer(const std::string& name)
{
    auto& timer = timers_[name];
    if (!timer.isRunning) {
        timer.startTime = std::chrono::steady_clock::now();
        timer.isRunning = true;
        timer.callCount++;
    }
}

double Timers::stopTimer(const std::string& name)
{
    auto it = timers_.find(name);
    if (it == timers_.end()) {
        return -1.0;
    }

    auto& timer = it->second;
    if (timer.isRunning) {
        timer.accumulatedTime += elapsedMs(timer.startTime);
        timer.isRunning = false;
    }
    return timer.accumulatedTime;
}

bool Timers::hasTimer(const std::string& name) const
{
    return timers_.find(name) != timers_.end();
}

double Timers::getAccumulatedTime(const std::string& name) const
{
    auto it = timers_.find(name);
    if (it == timers_.end()) {
        return -1.0;
    }

    const auto& timer = it->second;
    if (!timer.isRunning) {
        return timer.accumulatedTime;
    }
    return timer.accumulatedTime + elapsedMs(timer.startTime);
}

void Timers::resetTimer(const std::string& name)
{
    auto it = timers_.find(name);
    if (it != timers_.end()) {
        it->second.accumulatedTime = 0.0;
        if (it->second.isRunning) {
            it->second.startTime = std::chrono::steady_clock::now();
        }
    }
}

uint32_t Timers::getCallCount(const std::string& name) const
{
    auto it = timers_.find(name);
    if (it == timers_.end()) {
        return 0;
    }
    return it->second.callCount;
}

void Timers::resetCallCount(const std::string& name)
{
    auto it = timers_.find(name);
    if (it != timers_.end()) {
        it->second.callCount = 0;
    }
}

void Timers::dumpTimerStats() const
{
    auto log = LoggingChannels::sim();
    log->info("Timer statistics:");

    const double tickTime = getAccumulatedTime("advance_tick");
    for (const auto& name : getAllTimerNames()) {
        const double time = getAccumulatedTime(name);
        const uint32_t calls = getCallCount(name);
        const double avg = calls > 0 ? time / calls : 0.0;
        if (tickTime > 0.0 && name != "advance_tick") {
            log->info(
                "  {}: {:.3f}ms ({:.1f}% of advance_tick, {:.3f}ms avg, {} calls)",
                name,
                time,
                time / tickTime * 100.0,
                avg,
                calls);
        }
        else {
            log->info("  {}: {:.3f}ms ({:.3f}ms avg, {} calls)", name, time, avg, calls);
        }
    }
}

std::vector<std::string> Timers::getAllTimerNames() const
{
    std::vector<std::string> names;
    names.reserve(timers_.size());
    for (const auto& pair : timers_) {
        names.push_back(pair.first);
    }
    std::sort(names.begin(), names.end());
    return names;
}

nlohmann::json Timers::exportAllTimersAsJson() const
{
    nlohmann::json j = nlohmann::json::object();

    for (const auto& [name, timerData] : timers_) {
        const double total_ms = getAccumulatedTime(name);
        const uint32_t calls = timerData.callCount;
        const double avg_ms = calls > 0 ? total_ms / calls : 0.0;

        j[name] = { { "total_ms", total_ms }, { "avg_ms", avg_ms }, { "calls", calls } };
    }

    return j;
}

} // namespace FallingSand
