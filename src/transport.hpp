#pragma once
#include "event.hpp"
#include "event_queue.hpp"
#include "net/websocket.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace prisma {

struct TransportOptions {
    std::chrono::milliseconds heartbeat_interval{25000};
    std::chrono::milliseconds heartbeat_timeout{10000};
    long connect_timeout = 10; // seconds
};

using SocketFactory = std::function<std::unique_ptr<StreamSocket>()>;

// Streaming endpoint for a REST base address: https → wss, anything else →
// ws, default ports dropped, path /api/ws, token as a query parameter.
// Throws std::runtime_error if base_url is not a valid URL.
std::string stream_url_for(const std::string& base_url, const std::string& token);

// Owns the one streaming connection of a session.
//
// A reader thread connects, decodes inbound frames into events and pushes
// them to the queue; a heartbeat thread started by the reader pings on a
// fixed interval. At most one TransportErrorEvent is pushed per stream, and
// none after stop().
class SessionTransport {
public:
    SessionTransport(EventQueue& queue, SocketFactory factory,
                     TransportOptions options = {});
    ~SessionTransport();
    SessionTransport(const SessionTransport&)            = delete;
    SessionTransport& operator=(const SessionTransport&) = delete;

    // Start streaming for base_url with the session token. Returns
    // immediately; failures arrive as a TransportErrorEvent.
    void connect(const std::string& base_url, const std::string& token);

    // Close the connection, stop the heartbeat and join both threads.
    void stop();

    // True while the reader thread is streaming.
    bool running() const { return running_.load(); }

    // Decode one text frame. Unknown tags and payloads that do not match
    // their tag's schema yield nullopt.
    static std::optional<SessionEvent> decode_frame(const std::string& text);

private:
    void reader_loop(std::string url, std::vector<Header> headers);
    void heartbeat_loop();
    void report_error(const std::string& reason);

    EventQueue& queue_;
    SocketFactory factory_;
    TransportOptions options_;

    std::unique_ptr<StreamSocket> socket_;
    std::thread reader_;
    std::thread heartbeat_;

    std::atomic<bool> started_{false};
    std::atomic<bool> running_{false};
    std::atomic<bool> stopping_{false};
    std::atomic<bool> failed_{false};

    std::mutex hb_mutex_;
    std::condition_variable hb_cv_;
    bool stream_done_ = false;
};

} // namespace prisma
