#pragma once
#include "models.hpp"
#include <cstdint>
#include <set>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace prisma {

// Everything the reducer consumes is one immutable value of SessionEvent.
// Producers (transport, command workers, input reader) push these into the
// EventQueue; only the session loop applies them.

// ── Event tags ──────────────────────────────────────────────────

namespace event_tags {
    constexpr const char* TopologyLoaded  = "TopologyLoaded";
    constexpr const char* TopologyFailed  = "TopologyFailed";
    constexpr const char* HistoryLoaded   = "HistoryLoaded";
    constexpr const char* HistoryFailed   = "HistoryFailed";
    constexpr const char* MessageCreated  = "MessageCreated";
    constexpr const char* PresenceChanged = "PresenceChanged";
    constexpr const char* TransportError  = "TransportError";
    constexpr const char* SelectChannel   = "SelectChannel";
    constexpr const char* ScrollView      = "ScrollView";
    constexpr const char* SubmitText      = "SubmitText";
    constexpr const char* SendFailed      = "SendFailed";
    constexpr const char* UnknownCommand  = "UnknownCommand";
    constexpr const char* QuitRequested   = "QuitRequested";
} // namespace event_tags

// ── Event structs ───────────────────────────────────────────────

struct TopologyLoadedEvent {
    static constexpr const char* TAG = event_tags::TopologyLoaded;
    std::vector<ChannelCategory> categories;
};

struct TopologyFailedEvent {
    static constexpr const char* TAG = event_tags::TopologyFailed;
    std::string reason;
};

// Messages are oldest first.
struct HistoryLoadedEvent {
    static constexpr const char* TAG = event_tags::HistoryLoaded;
    int64_t channel_id = 0;
    std::vector<Message> messages;
};

struct HistoryFailedEvent {
    static constexpr const char* TAG = event_tags::HistoryFailed;
    int64_t channel_id = 0;
    std::string reason;
};

struct MessageCreatedEvent {
    static constexpr const char* TAG = event_tags::MessageCreated;
    Message message;
};

struct PresenceChangedEvent {
    static constexpr const char* TAG = event_tags::PresenceChanged;
    std::set<std::string> usernames;
};

struct TransportErrorEvent {
    static constexpr const char* TAG = event_tags::TransportError;
    std::string reason;
};

// delta is +1 (next) or -1 (previous).
struct SelectChannelEvent {
    static constexpr const char* TAG = event_tags::SelectChannel;
    int delta = 1;
};

// Move the message viewport of the active channel.
struct ScrollViewEvent {
    static constexpr const char* TAG = event_tags::ScrollView;
    enum class Kind { Up, Down, Top, Bottom };
    Kind kind = Kind::Up;
};

struct SubmitTextEvent {
    static constexpr const char* TAG = event_tags::SubmitText;
    std::string text;
};

struct SendFailedEvent {
    static constexpr const char* TAG = event_tags::SendFailed;
    int64_t channel_id = 0;
    std::string reason;
};

struct UnknownCommandEvent {
    static constexpr const char* TAG = event_tags::UnknownCommand;
    std::string command;
};

struct QuitRequestedEvent {
    static constexpr const char* TAG = event_tags::QuitRequested;
};

using SessionEvent = std::variant<
    TopologyLoadedEvent,
    TopologyFailedEvent,
    HistoryLoadedEvent,
    HistoryFailedEvent,
    MessageCreatedEvent,
    PresenceChangedEvent,
    TransportErrorEvent,
    SelectChannelEvent,
    ScrollViewEvent,
    SubmitTextEvent,
    SendFailedEvent,
    UnknownCommandEvent,
    QuitRequestedEvent>;

inline const char* event_tag(const SessionEvent& ev) {
    return std::visit([](const auto& e) { return std::decay_t<decltype(e)>::TAG; }, ev);
}

// ── Commands ────────────────────────────────────────────────────
//
// Side effects requested by the reducer, executed off the session thread.

struct FetchTopologyCommand {};

struct FetchHistoryCommand {
    int64_t channel_id = 0;
};

struct SendMessageCommand {
    int64_t channel_id = 0;
    std::string content;
};

using Command = std::variant<FetchTopologyCommand, FetchHistoryCommand, SendMessageCommand>;

} // namespace prisma
