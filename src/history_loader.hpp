#pragma once
#include "api_client.hpp"
#include "event.hpp"

namespace prisma {

// On-demand bulk fetch of a channel's past messages. The result is a single
// event; messages are delivered oldest first.
class HistoryLoader {
public:
    explicit HistoryLoader(ApiClient& api) : api_(api) {}

    // HistoryLoadedEvent or HistoryFailedEvent. Never throws.
    SessionEvent load(int64_t channel_id);

private:
    ApiClient& api_;
};

} // namespace prisma
