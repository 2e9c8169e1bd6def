#pragma once
#include "event.hpp"
#include "event_queue.hpp"
#include "reducer.hpp"
#include "state.hpp"

#include <functional>

namespace prisma {

// The session loop: the only thread that reads or writes SessionState.
//
// Pops events from the queue, applies them with reduce(), hands resulting
// commands to the command sink and calls the view sink whenever the state
// asks for a redraw.
class ChatSession {
public:
    using CommandSink = std::function<void(const Command&)>;
    using ViewSink    = std::function<void(const SessionState&)>;

    enum class Exit { Quit, QueueClosed };

    ChatSession(EventQueue& queue, User self, CommandSink commands, ViewSink view);

    // Issue the initial commands and process events until a quit request or
    // until the queue is closed.
    Exit run();

    // Apply a single event. Returns false for a quit request.
    bool step(const SessionEvent& event);

    const SessionState& state() const { return state_; }

private:
    void dispatch(std::vector<Command> commands);
    void refresh();

    EventQueue& queue_;
    SessionState state_;
    CommandSink commands_;
    ViewSink view_;
};

} // namespace prisma
