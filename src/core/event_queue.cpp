#include "core/event_queue.hpp"

namespace asciicam {

void EventQueue::push(Event ev) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(std::move(ev));
    }
    cv_.notify_one();
}

std::vector<Event> EventQueue::drain(std::chrono::nanoseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (events_.empty() && timeout > std::chrono::nanoseconds(0)) {
        cv_.wait_for(lock, timeout, [this] { return !events_.empty(); });
    }
    return take_all_locked();
}

bool EventQueue::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.empty();
}

std::vector<Event> EventQueue::take_all_locked() {
    std::vector<Event> out;
    out.reserve(events_.size());
    for (auto& ev : events_) {
        out.push_back(std::move(ev));
    }
    events_.clear();
    return out;
}

}
