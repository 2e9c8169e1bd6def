#include "session.hpp"
#include <iostream>

namespace prisma {

ChatSession::ChatSession(EventQueue& queue, User self, CommandSink commands, ViewSink view)
    : queue_(queue), commands_(std::move(commands)), view_(std::move(view))
{
    state_.self = std::move(self);
}

void ChatSession::dispatch(std::vector<Command> commands) {
    if (!commands_) return;
    for (const auto& cmd : commands) commands_(cmd);
}

void ChatSession::refresh() {
    if (!state_.view_dirty) return;
    state_.view_dirty = false;
    if (view_) view_(state_);
}

bool ChatSession::step(const SessionEvent& event) {
    if (std::holds_alternative<QuitRequestedEvent>(event)) return false;

    ConnectionState before = state_.connection_state;
    dispatch(reduce(state_, event));
    if (state_.connection_state != before) {
        std::cerr << "[session] " << connection_state_name(before) << " -> "
                  << connection_state_name(state_.connection_state)
                  << " on " << event_tag(event);
        if (state_.connection_state == ConnectionState::Error)
            std::cerr << ": " << state_.last_error;
        std::cerr << "\n";
    }
    refresh();
    return true;
}

ChatSession::Exit ChatSession::run() {
    dispatch(initial_commands());
    refresh();

    while (true) {
        auto event = queue_.pop();
        if (!event) return Exit::QueueClosed;
        if (!step(*event)) return Exit::Quit;
    }
}

} // namespace prisma
