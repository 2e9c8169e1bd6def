#pragma once
#include "models.hpp"
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace prisma {

enum class ConnectionState { Connecting, Live, Error };

const char* connection_state_name(ConnectionState s);

// The session's in-memory model. Owned by the session loop and mutated only
// by reduce().
struct SessionState {
    User self;

    // Flattened from the topology, stable-sorted by position. Set once.
    std::vector<Channel> channels;

    // Oldest first. Append-only once created, except that installing history
    // replaces the buffer with history plus the live messages it lacked.
    std::unordered_map<int64_t, std::vector<Message>> messages_by_channel;

    // Replaced wholesale on every presence update.
    std::set<std::string> online_users;

    // Engaged iff channels is non-empty.
    std::optional<size_t> active_channel_index;

    // Number of newest messages of the active channel hidden below the
    // view. 0 follows the tail.
    size_t scroll_offset = 0;

    ConnectionState connection_state = ConnectionState::Connecting;
    std::string last_error;
    std::string notice;

    // Channels with a history fetch in flight.
    std::unordered_set<int64_t> pending_history;

    bool view_dirty = true;

    const Channel* active_channel() const;

    // Buffer for a channel, or nullptr if it has none yet.
    const std::vector<Message>* messages_for(int64_t channel_id) const;
};

// Concatenate every category's channels, then stable-sort by channel
// position. Category order only breaks ties.
std::vector<Channel> flatten_channels(const std::vector<ChannelCategory>& categories);

} // namespace prisma
