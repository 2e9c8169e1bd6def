#pragma once
#include "event.hpp"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace prisma {

// Multi-producer, single-consumer FIFO feeding the session loop.
// Events from one producer keep their order; nothing is promised across
// producers.
class EventQueue {
public:
    // Enqueue an event. Returns false (and drops it) once closed.
    bool push(SessionEvent event);

    // Block until an event is available. Returns nullopt once the queue is
    // closed and drained.
    std::optional<SessionEvent> pop();

    // Like pop(), but gives up after timeout.
    std::optional<SessionEvent> pop_for(std::chrono::milliseconds timeout);

    // Wake the consumer and reject further pushes.
    void close();

    bool closed() const;
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<SessionEvent> events_;
    bool closed_ = false;
};

} // namespace prisma
