#include "reducer.hpp"
#include "util.hpp"
#include <algorithm>
#include <unordered_set>

namespace prisma {

namespace {

void fail(SessionState& state, const std::string& reason) {
    state.connection_state = ConnectionState::Error;
    state.last_error = reason;
    state.view_dirty = true;
}

bool is_active(const SessionState& state, int64_t channel_id) {
    const Channel* active = state.active_channel();
    return active && active->id == channel_id;
}

// History first, then any live messages that arrived before it and are not
// part of it.
void install_history(std::vector<Message>& buffer, const std::vector<Message>& history) {
    std::unordered_set<int64_t> ids;
    for (const auto& m : history) ids.insert(m.id);

    std::vector<Message> merged = history;
    for (auto& m : buffer)
        if (ids.insert(m.id).second) merged.push_back(std::move(m));
    buffer = std::move(merged);
}

struct Reducer {
    SessionState& state;
    std::vector<Command> commands;

    bool live() const { return state.connection_state == ConnectionState::Live; }

    void request_history(int64_t channel_id) {
        if (state.pending_history.insert(channel_id).second)
            commands.push_back(FetchHistoryCommand{channel_id});
    }

    void operator()(const TopologyLoadedEvent& ev) {
        if (state.connection_state != ConnectionState::Connecting) return;
        state.channels = flatten_channels(ev.categories);
        if (state.channels.empty()) {
            fail(state, "no channels found on server");
            return;
        }
        state.active_channel_index = 0;
        state.connection_state = ConnectionState::Live;
        state.view_dirty = true;
        request_history(state.channels.front().id);
    }

    void operator()(const TopologyFailedEvent& ev) {
        fail(state, ev.reason);
    }

    void operator()(const HistoryLoadedEvent& ev) {
        if (!live()) return;
        state.pending_history.erase(ev.channel_id);
        install_history(state.messages_by_channel[ev.channel_id], ev.messages);
        if (is_active(state, ev.channel_id)) {
            state.scroll_offset = 0;
            state.view_dirty = true;
        }
    }

    void operator()(const HistoryFailedEvent& ev) {
        if (!live()) return;
        state.pending_history.erase(ev.channel_id);
        fail(state, ev.reason);
    }

    void operator()(const MessageCreatedEvent& ev) {
        auto& buffer = state.messages_by_channel[ev.message.channel_id];
        for (const auto& m : buffer)
            if (m.id == ev.message.id) return;
        buffer.push_back(ev.message);
        if (is_active(state, ev.message.channel_id)) {
            state.scroll_offset = 0;
            state.view_dirty = true;
        }
    }

    void operator()(const PresenceChangedEvent& ev) {
        state.online_users = ev.usernames;
        state.view_dirty = true;
    }

    void operator()(const TransportErrorEvent& ev) {
        fail(state, ev.reason);
    }

    void operator()(const SelectChannelEvent& ev) {
        if (!live() || state.channels.empty() || !state.active_channel_index) return;
        auto n = static_cast<long long>(state.channels.size());
        auto idx = static_cast<long long>(*state.active_channel_index);
        idx = ((idx + ev.delta) % n + n) % n;
        state.active_channel_index = static_cast<size_t>(idx);
        state.scroll_offset = 0;
        state.view_dirty = true;

        int64_t id = state.channels[static_cast<size_t>(idx)].id;
        if (!state.messages_for(id)) request_history(id);
    }

    void operator()(const ScrollViewEvent& ev) {
        if (!live()) return;
        const Channel* active = state.active_channel();
        const std::vector<Message>* msgs = active ? state.messages_for(active->id) : nullptr;
        // At least the oldest message stays on screen.
        size_t max_offset = msgs && !msgs->empty() ? msgs->size() - 1 : 0;

        size_t offset = state.scroll_offset;
        switch (ev.kind) {
        case ScrollViewEvent::Kind::Up:     offset += kScrollStep; break;
        case ScrollViewEvent::Kind::Down:   offset = offset > kScrollStep ? offset - kScrollStep : 0; break;
        case ScrollViewEvent::Kind::Top:    offset = max_offset; break;
        case ScrollViewEvent::Kind::Bottom: offset = 0; break;
        }
        offset = std::min(offset, max_offset);
        if (offset != state.scroll_offset) {
            state.scroll_offset = offset;
            state.view_dirty = true;
        }
    }

    void operator()(const SubmitTextEvent& ev) {
        if (!live()) return;
        std::string text = trim(ev.text);
        const Channel* active = state.active_channel();
        if (text.empty() || !active) return;
        size_t length = utf8_length(text);
        if (length > kMaxMessageLength) {
            state.notice = "message too long: " + std::to_string(length) +
                           " characters (limit " + std::to_string(kMaxMessageLength) + ")";
            state.view_dirty = true;
            return;
        }
        commands.push_back(SendMessageCommand{active->id, text});
        if (!state.notice.empty()) {
            state.notice.clear();
            state.view_dirty = true;
        }
    }

    void operator()(const SendFailedEvent& ev) {
        if (!live()) return;
        state.notice = "send failed: " + ev.reason;
        state.view_dirty = true;
    }

    void operator()(const UnknownCommandEvent& ev) {
        if (!live()) return;
        state.notice = "Unknown command: " + ev.command;
        state.view_dirty = true;
    }

    // Handled by the session loop.
    void operator()(const QuitRequestedEvent&) {}
};

} // namespace

std::vector<Command> reduce(SessionState& state, const SessionEvent& event) {
    if (state.connection_state == ConnectionState::Error) return {};
    Reducer r{state, {}};
    std::visit(r, event);
    return std::move(r.commands);
}

std::vector<Command> initial_commands() {
    return {FetchTopologyCommand{}};
}

} // namespace prisma
