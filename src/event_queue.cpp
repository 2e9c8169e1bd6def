#include "event_queue.hpp"

namespace prisma {

bool EventQueue::push(SessionEvent event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return false;
        events_.push_back(std::move(event));
    }
    cv_.notify_one();
    return true;
}

std::optional<SessionEvent> EventQueue::pop() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return closed_ || !events_.empty(); });
    if (events_.empty()) return std::nullopt;
    SessionEvent ev = std::move(events_.front());
    events_.pop_front();
    return ev;
}

std::optional<SessionEvent> EventQueue::pop_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] { return closed_ || !events_.empty(); }))
        return std::nullopt;
    if (events_.empty()) return std::nullopt;
    SessionEvent ev = std::move(events_.front());
    events_.pop_front();
    return ev;
}

void EventQueue::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool EventQueue::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t EventQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

} // namespace prisma
