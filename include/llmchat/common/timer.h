#pragma once

#include <chrono>

namespace llmchat {

// Wall clock stopwatch. reset() returns the seconds elapsed since the last start() or reset().
class Timer {
public:
    using Clock = std::chrono::steady_clock;

    void start() { mStart = Clock::now(); }

    double reset() {
        const auto now = Clock::now();
        const std::chrono::duration<double> elapsed = now - mStart;
        mStart = now;
        return elapsed.count();
    }

private:
    Clock::time_point mStart = Clock::now();
};

} // namespace llmchat
