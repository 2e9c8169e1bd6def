#include "transport.hpp"
#include "util.hpp"

#include <nlohmann/json.hpp>
#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace prisma {

std::string stream_url_for(const std::string& base_url, const std::string& token) {
    ParsedUrl base = parse_url(base_url);
    std::string scheme = base.scheme == "https" ? "wss" : "ws";
    bool default_port = (scheme == "ws" && base.port == "80") ||
                        (scheme == "wss" && base.port == "443");
    std::string url = scheme + "://" + base.host;
    if (!default_port) url += ":" + base.port;
    url += "/api/ws?token=" + url_encode(token);
    return url;
}

SessionTransport::SessionTransport(EventQueue& queue, SocketFactory factory,
                                   TransportOptions options)
    : queue_(queue), factory_(std::move(factory)), options_(options)
{}

SessionTransport::~SessionTransport() {
    stop();
}

void SessionTransport::report_error(const std::string& reason) {
    if (stopping_.load()) return;
    if (failed_.exchange(true)) return;
    std::cerr << "[transport] " << reason << "\n";
    queue_.push(TransportErrorEvent{reason});
}

void SessionTransport::connect(const std::string& base_url, const std::string& token) {
    if (started_.exchange(true)) return;

    if (token.empty()) {
        report_error("must be logged in to connect");
        return;
    }

    std::string url;
    try {
        url = stream_url_for(base_url, token);
    } catch (const std::exception& e) {
        report_error(std::string("websocket dial error: ") + e.what());
        return;
    }

    socket_ = factory_();
    if (!socket_) {
        report_error("websocket dial error: no socket available");
        return;
    }
    std::vector<Header> headers = {{"Origin", base_url}};
    running_.store(true);
    reader_ = std::thread(&SessionTransport::reader_loop, this,
                          std::move(url), std::move(headers));
}

void SessionTransport::stop() {
    stopping_.store(true);
    if (socket_) socket_->shutdown();
    {
        std::lock_guard<std::mutex> lock(hb_mutex_);
        stream_done_ = true;
    }
    hb_cv_.notify_all();
    if (reader_.joinable()) reader_.join();
}

// ── Reader ─────────────────────────────────────────────────────

void SessionTransport::reader_loop(std::string url, std::vector<Header> headers) {
    std::string error;
    if (!socket_->connect(url, headers, options_.connect_timeout, error)) {
        report_error("websocket dial error: " + error);
        running_.store(false);
        return;
    }

    heartbeat_ = std::thread(&SessionTransport::heartbeat_loop, this);

    while (!stopping_.load()) {
        StreamRead r = socket_->read();
        if (r.status == StreamRead::Status::Message) {
            auto ev = decode_frame(r.data);
            if (ev) queue_.push(std::move(*ev));
            continue;
        }
        if (r.status == StreamRead::Status::Closed) {
            if (r.close_code != kWsCloseNormal && r.close_code != kWsCloseGoingAway)
                report_error("websocket read error: connection closed (code " +
                             std::to_string(r.close_code) + ")");
            else
                std::cerr << "[transport] server closed the stream\n";
        } else {
            report_error("websocket read error: " + r.error);
        }
        break;
    }

    {
        std::lock_guard<std::mutex> lock(hb_mutex_);
        stream_done_ = true;
    }
    hb_cv_.notify_all();
    heartbeat_.join();
    running_.store(false);
}

// ── Heartbeat ──────────────────────────────────────────────────

void SessionTransport::heartbeat_loop() {
    using namespace std::chrono;
    long write_timeout = std::max<long>(1, static_cast<long>(
        duration_cast<seconds>(options_.heartbeat_timeout + milliseconds(999)).count()));
    auto wait = options_.heartbeat_interval;

    while (true) {
        {
            std::unique_lock<std::mutex> lock(hb_mutex_);
            if (hb_cv_.wait_for(lock, wait, [this] { return stream_done_; })) return;
        }

        auto sent_at = steady_clock::now();
        std::string error;
        if (!socket_->ping(write_timeout, error)) {
            report_error("websocket ping failed: " + error);
            socket_->shutdown();
            return;
        }

        {
            std::unique_lock<std::mutex> lock(hb_mutex_);
            if (hb_cv_.wait_for(lock, options_.heartbeat_timeout,
                                [this] { return stream_done_; }))
                return;
        }
        if (socket_->last_received() < sent_at) {
            report_error("websocket ping failed: no response within " +
                         std::to_string(duration_cast<milliseconds>(
                             options_.heartbeat_timeout).count()) + "ms");
            socket_->shutdown();
            return;
        }

        wait = options_.heartbeat_interval > options_.heartbeat_timeout
            ? duration_cast<milliseconds>(options_.heartbeat_interval - options_.heartbeat_timeout)
            : milliseconds(0);
    }
}

// ── Frame decoding ─────────────────────────────────────────────

std::optional<SessionEvent> SessionTransport::decode_frame(const std::string& text) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    }
    if (!j.is_object() || !j.contains("event") || !j["event"].is_string())
        return std::nullopt;

    const std::string tag = j["event"].get<std::string>();
    const nlohmann::json payload = j.contains("payload") ? j["payload"] : nlohmann::json();

    if (tag == "new_message") {
        MessageCreatedEvent ev;
        if (!parse_message(payload, ev.message)) return std::nullopt;
        return ev;
    }
    if (tag == "presence_update") {
        std::vector<User> users;
        if (!payload.is_array() || !parse_users(payload, users)) return std::nullopt;
        PresenceChangedEvent ev;
        for (const auto& u : users) ev.usernames.insert(u.username);
        return ev;
    }
    return std::nullopt;
}

} // namespace prisma
