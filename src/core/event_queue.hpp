#pragma once

#include "core/event.hpp"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <vector>

namespace asciicam {

// Multi-producer queue feeding the event router. Producers are the capture
// thread (frames, device acks) and the input thread (commands).
class EventQueue {
public:
    EventQueue() = default;
    EventQueue(const EventQueue&) = delete;
    EventQueue& operator=(const EventQueue&) = delete;

    void push(Event ev);

    // Waits up to `timeout` for the first event, then takes everything queued.
    std::vector<Event> drain(std::chrono::nanoseconds timeout);

    bool empty() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Event> events_;

    std::vector<Event> take_all_locked();
};

}
