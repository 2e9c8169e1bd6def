#pragma once
#include "event.hpp"
#include "state.hpp"
#include <vector>

namespace prisma {

// Messages moved per /up or /down.
constexpr size_t kScrollStep = 10;

// Longest message body accepted for sending, in characters.
constexpr size_t kMaxMessageLength = 280;

// Apply one event to the session state and return the follow-up commands.
// Runs only on the session thread; never blocks and never performs I/O.
//
// Once the state is Error, every event is ignored.
std::vector<Command> reduce(SessionState& state, const SessionEvent& event);

// Commands to issue before the first event: the topology fetch.
std::vector<Command> initial_commands();

} // namespace prisma
