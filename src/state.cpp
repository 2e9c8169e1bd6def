#include "state.hpp"
#include <algorithm>

namespace prisma {

const char* connection_state_name(ConnectionState s) {
    switch (s) {
    case ConnectionState::Connecting: return "connecting";
    case ConnectionState::Live:       return "live";
    case ConnectionState::Error:      return "error";
    }
    return "unknown";
}

const Channel* SessionState::active_channel() const {
    if (!active_channel_index || *active_channel_index >= channels.size())
        return nullptr;
    return &channels[*active_channel_index];
}

const std::vector<Message>* SessionState::messages_for(int64_t channel_id) const {
    auto it = messages_by_channel.find(channel_id);
    return it == messages_by_channel.end() ? nullptr : &it->second;
}

std::vector<Channel> flatten_channels(const std::vector<ChannelCategory>& categories) {
    std::vector<Channel> flat;
    for (const auto& cat : categories)
        flat.insert(flat.end(), cat.channels.begin(), cat.channels.end());
    std::stable_sort(flat.begin(), flat.end(),
                     [](const Channel& a, const Channel& b) { return a.position < b.position; });
    return flat;
}

} // namespace prisma
