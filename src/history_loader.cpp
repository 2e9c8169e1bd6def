#include "history_loader.hpp"
#include <algorithm>
#include <exception>

namespace prisma {

SessionEvent HistoryLoader::load(int64_t channel_id) {
    try {
        HistoryLoadedEvent ev;
        ev.channel_id = channel_id;
        ev.messages = api_.get_messages(channel_id);
        // Server sends newest first.
        std::reverse(ev.messages.begin(), ev.messages.end());
        return ev;
    } catch (const std::exception& e) {
        return HistoryFailedEvent{channel_id, e.what()};
    }
}

} // namespace prisma
