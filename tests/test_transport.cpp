#include <catch2/catch.hpp>
#include "transport.hpp"
#include "mock_stream_socket.hpp"

#include <chrono>
#include <thread>

using namespace prisma;
using namespace std::chrono_literals;

// ── stream_url_for ───────────────────────────────────────────────

TEST_CASE("stream_url_for: http becomes ws", "[transport]") {
    REQUIRE(stream_url_for("http://localhost:8081", "abc") ==
            "ws://localhost:8081/api/ws?token=abc");
}

TEST_CASE("stream_url_for: https becomes wss and drops 443", "[transport]") {
    REQUIRE(stream_url_for("https://chat.example.com:443", "t") ==
            "wss://chat.example.com/api/ws?token=t");
    REQUIRE(stream_url_for("https://chat.example.com", "t") ==
            "wss://chat.example.com/api/ws?token=t");
}

TEST_CASE("stream_url_for: plaintext port 80 is dropped", "[transport]") {
    REQUIRE(stream_url_for("http://example.com:80/ignored/path", "t") ==
            "ws://example.com/api/ws?token=t");
}

TEST_CASE("stream_url_for: non-default ports are kept", "[transport]") {
    REQUIRE(stream_url_for("https://example.com:8443", "t") ==
            "wss://example.com:8443/api/ws?token=t");
    REQUIRE(stream_url_for("http://example.com:443", "t") ==
            "ws://example.com:443/api/ws?token=t");
}

TEST_CASE("stream_url_for: token is URL-encoded", "[transport]") {
    REQUIRE(stream_url_for("http://h:1", "a+b/c=") == "ws://h:1/api/ws?token=a%2Bb%2Fc%3D");
}

TEST_CASE("stream_url_for: invalid base throws", "[transport]") {
    REQUIRE_THROWS(stream_url_for("not a url", "t"));
}

// ── decode_frame ─────────────────────────────────────────────────

TEST_CASE("decode_frame: new_message", "[transport]") {
    auto ev = SessionTransport::decode_frame(
        R"({"event":"new_message","payload":{"id":5,"channel_id":2,"user_id":1,)"
        R"("username":"bob","content":"yo","created_at":"2024-01-02T03:04:05Z"}})");
    REQUIRE(ev.has_value());
    auto* created = std::get_if<MessageCreatedEvent>(&*ev);
    REQUIRE(created != nullptr);
    REQUIRE(created->message.id == 5);
    REQUIRE(created->message.channel_id == 2);
    REQUIRE(created->message.content == "yo");
}

TEST_CASE("decode_frame: presence_update yields usernames", "[transport]") {
    auto ev = SessionTransport::decode_frame(
        R"({"event":"presence_update","payload":[{"id":1,"username":"alice"},{"id":2,"username":"bob"}]})");
    REQUIRE(ev.has_value());
    auto* presence = std::get_if<PresenceChangedEvent>(&*ev);
    REQUIRE(presence != nullptr);
    REQUIRE(presence->usernames == std::set<std::string>{"alice", "bob"});
}

TEST_CASE("decode_frame: empty presence list is a valid update", "[transport]") {
    auto ev = SessionTransport::decode_frame(R"({"event":"presence_update","payload":[]})");
    REQUIRE(ev.has_value());
    REQUIRE(std::get<PresenceChangedEvent>(*ev).usernames.empty());
}

TEST_CASE("decode_frame: unknown tag is dropped", "[transport]") {
    REQUIRE_FALSE(SessionTransport::decode_frame(
        R"({"event":"typing","payload":{"user":"alice"}})").has_value());
}

TEST_CASE("decode_frame: malformed frames are dropped", "[transport]") {
    REQUIRE_FALSE(SessionTransport::decode_frame("not json").has_value());
    REQUIRE_FALSE(SessionTransport::decode_frame("[1,2]").has_value());
    REQUIRE_FALSE(SessionTransport::decode_frame(R"({"payload":{}})").has_value());
    REQUIRE_FALSE(SessionTransport::decode_frame(R"({"event":7})").has_value());
}

TEST_CASE("decode_frame: payload not matching its tag is dropped", "[transport]") {
    REQUIRE_FALSE(SessionTransport::decode_frame(
        R"({"event":"new_message","payload":{"content":"no ids"}})").has_value());
    REQUIRE_FALSE(SessionTransport::decode_frame(
        R"({"event":"new_message"})").has_value());
    REQUIRE_FALSE(SessionTransport::decode_frame(
        R"({"event":"presence_update","payload":{"username":"alice"}})").has_value());
}

// ── Streaming with a scripted socket ─────────────────────────────

namespace {

TransportOptions quiet_heartbeat() {
    TransportOptions opts;
    opts.heartbeat_interval = 10s;
    opts.heartbeat_timeout = 1s;
    return opts;
}

struct Harness {
    EventQueue queue;
    MockStreamSocket* socket = nullptr;
    std::unique_ptr<SessionTransport> transport;

    explicit Harness(TransportOptions opts = quiet_heartbeat()) {
        auto owned = std::make_shared<std::unique_ptr<MockStreamSocket>>(
            std::make_unique<MockStreamSocket>());
        socket = owned->get();
        transport = std::make_unique<SessionTransport>(
            queue, [owned]() -> std::unique_ptr<StreamSocket> { return std::move(*owned); },
            opts);
    }

    std::optional<SessionEvent> next(std::chrono::milliseconds timeout = 2000ms) {
        return queue.pop_for(timeout);
    }

    void wait_until_stopped() {
        for (int i = 0; i < 200 && transport->running(); ++i)
            std::this_thread::sleep_for(10ms);
    }
};

bool is_transport_error(const std::optional<SessionEvent>& ev, const std::string& prefix) {
    if (!ev) return false;
    auto* err = std::get_if<TransportErrorEvent>(&*ev);
    return err && err->reason.rfind(prefix, 0) == 0;
}

} // namespace

TEST_CASE("SessionTransport: connects to the derived URL with Origin", "[transport]") {
    Harness h;
    h.transport->connect("https://chat.example.com", "tok");
    h.socket->push_message(R"({"event":"presence_update","payload":[{"username":"alice"}]})");

    auto ev = h.next();
    REQUIRE(ev.has_value());
    REQUIRE(std::holds_alternative<PresenceChangedEvent>(*ev));

    h.transport->stop();
    REQUIRE(h.socket->connected_url == "wss://chat.example.com/api/ws?token=tok");
    REQUIRE(h.socket->connected_headers.size() == 1);
    REQUIRE(h.socket->connected_headers[0].first == "Origin");
    REQUIRE(h.socket->connected_headers[0].second == "https://chat.example.com");
}

TEST_CASE("SessionTransport: frames are delivered in order, junk skipped", "[transport]") {
    Harness h;
    h.transport->connect("http://localhost:8081", "tok");
    h.socket->push_message(R"({"event":"new_message","payload":{"id":1,"channel_id":1}})");
    h.socket->push_message(R"({"event":"typing","payload":{}})");
    h.socket->push_message("garbage");
    h.socket->push_message(R"({"event":"new_message","payload":{"id":2,"channel_id":1}})");

    auto first = h.next();
    auto second = h.next();
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    REQUIRE(std::get<MessageCreatedEvent>(*first).message.id == 1);
    REQUIRE(std::get<MessageCreatedEvent>(*second).message.id == 2);
    REQUIRE_FALSE(h.next(100ms).has_value());
}

TEST_CASE("SessionTransport: missing token reports an error without connecting", "[transport]") {
    Harness h;
    h.transport->connect("http://localhost:8081", "");
    REQUIRE(is_transport_error(h.next(), "must be logged in to connect"));
    REQUIRE(h.socket->connected_url.empty());
    REQUIRE_FALSE(h.transport->running());
}

TEST_CASE("SessionTransport: dial failure emits exactly one error", "[transport]") {
    Harness h;
    h.socket->connect_ok = false;
    h.transport->connect("http://localhost:8081", "tok");

    REQUIRE(is_transport_error(h.next(), "websocket dial error: connection refused"));
    h.wait_until_stopped();
    REQUIRE_FALSE(h.next(100ms).has_value());
}

TEST_CASE("SessionTransport: normal and going-away closes end quietly", "[transport]") {
    uint16_t code = GENERATE(kWsCloseNormal, kWsCloseGoingAway);
    Harness h;
    h.transport->connect("http://localhost:8081", "tok");
    h.socket->push_close(code);

    h.wait_until_stopped();
    REQUIRE_FALSE(h.transport->running());
    REQUIRE_FALSE(h.next(100ms).has_value());
}

TEST_CASE("SessionTransport: abnormal close is reported", "[transport]") {
    Harness h;
    h.transport->connect("http://localhost:8081", "tok");
    h.socket->push_close(kWsCloseAbnormal);

    REQUIRE(is_transport_error(h.next(), "websocket read error"));
    h.wait_until_stopped();
    REQUIRE_FALSE(h.next(100ms).has_value());
}

TEST_CASE("SessionTransport: read failure is reported", "[transport]") {
    Harness h;
    h.transport->connect("http://localhost:8081", "tok");
    h.socket->push_failure("connection reset");
    REQUIRE(is_transport_error(h.next(), "websocket read error: connection reset"));
}

TEST_CASE("SessionTransport: stop is silent and releases the socket", "[transport]") {
    Harness h;
    h.transport->connect("http://localhost:8081", "tok");
    std::this_thread::sleep_for(50ms);
    h.transport->stop();

    REQUIRE_FALSE(h.transport->running());
    REQUIRE(h.socket->was_shut_down());
    REQUIRE_FALSE(h.next(100ms).has_value());
}

TEST_CASE("SessionTransport: heartbeat pings on its interval", "[transport]") {
    TransportOptions opts;
    opts.heartbeat_interval = 60ms;
    opts.heartbeat_timeout = 20ms;
    Harness h(opts);
    h.transport->connect("http://localhost:8081", "tok");

    std::this_thread::sleep_for(400ms);
    h.transport->stop();

    REQUIRE(h.socket->pings() >= 2);
    REQUIRE_FALSE(h.next(50ms).has_value());
}

TEST_CASE("SessionTransport: failed ping ends the stream with one error", "[transport]") {
    TransportOptions opts;
    opts.heartbeat_interval = 30ms;
    opts.heartbeat_timeout = 20ms;
    Harness h(opts);
    h.socket->ping_ok = false;
    h.transport->connect("http://localhost:8081", "tok");

    REQUIRE(is_transport_error(h.next(), "websocket ping failed: broken pipe"));
    h.wait_until_stopped();
    REQUIRE_FALSE(h.transport->running());
    REQUIRE(h.socket->was_shut_down());
    REQUIRE_FALSE(h.next(100ms).has_value());
}

TEST_CASE("SessionTransport: unanswered ping is a failure", "[transport]") {
    TransportOptions opts;
    opts.heartbeat_interval = 30ms;
    opts.heartbeat_timeout = 30ms;
    Harness h(opts);
    h.socket->pong_on_ping = false;
    h.transport->connect("http://localhost:8081", "tok");

    REQUIRE(is_transport_error(h.next(), "websocket ping failed: no response"));
    h.wait_until_stopped();
    REQUIRE_FALSE(h.transport->running());
}
