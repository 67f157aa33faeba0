#pragma once

#include <chrono>
#include <deque>

namespace asciicam {

// Events per second over a sliding one-second window.
class FpsCounter {
public:
    using time_point = std::chrono::steady_clock::time_point;

    void record(time_point t) {
        samples_.push_back(t);
        prune(t);
    }

    double fps(time_point now) {
        prune(now);
        return static_cast<double>(samples_.size());
    }

    void reset() { samples_.clear(); }

private:
    std::deque<time_point> samples_;

    void prune(time_point now) {
        const auto window = std::chrono::seconds(1);
        while (!samples_.empty() && now - samples_.front() >= window) {
            samples_.pop_front();
        }
    }
};

}
