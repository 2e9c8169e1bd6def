#pragma once
#include "http.hpp"
#include "net/connection.hpp"
#include "net/ws_frame.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace prisma {

struct StreamRead {
    enum class Status { Message, Closed, Failed };
    Status status = Status::Failed;
    std::string data;                      // Message: complete text payload
    uint16_t close_code = kWsCloseNoStatus; // Closed: peer's close code
    std::string error;                     // Failed: description
};

// Abstract streaming socket (injectable for testing).
//
// read() is called from one thread only; ping() and shutdown() may be called
// concurrently with it from other threads.
class StreamSocket {
public:
    virtual ~StreamSocket() = default;

    virtual bool connect(const std::string& url,
                         const std::vector<Header>& headers,
                         long timeout_seconds,
                         std::string& error) = 0;

    // Block until a complete data message, a close, or a failure.
    virtual StreamRead read() = 0;

    // Send a ping; the write must finish within timeout_seconds.
    virtual bool ping(long timeout_seconds, std::string& error) = 0;

    // Time of the most recent inbound byte (any frame, pongs included).
    virtual std::chrono::steady_clock::time_point last_received() const = 0;

    // Unblock read() and make further I/O fail. Thread-safe.
    virtual void shutdown() = 0;
};

// RFC 6455 client over Connection (TCP + optional TLS).
//
// One I/O mutex serializes every socket/TLS call; it is held only for the
// duration of a single read or write, never while waiting for readability,
// so a heartbeat ping can be written while the reader is idle.
class WebSocket : public StreamSocket {
public:
    WebSocket() = default;
    ~WebSocket() override = default;
    WebSocket(const WebSocket&)            = delete;
    WebSocket& operator=(const WebSocket&) = delete;

    bool connect(const std::string& url,
                 const std::vector<Header>& headers,
                 long timeout_seconds,
                 std::string& error) override;
    StreamRead read() override;
    bool ping(long timeout_seconds, std::string& error) override;
    std::chrono::steady_clock::time_point last_received() const override;
    void shutdown() override;

private:
    bool send_frame(WsOpcode opcode, const std::string& payload, long timeout_secs);
    bool read_handshake(std::string& error, long timeout_secs, const std::string& key);
    // Append more bytes to inbuf_. Returns >0 data, 0 EOF, -1 error or
    // shutdown, Connection::kWouldBlock once deadline passes.
    ssize_t fill(std::chrono::steady_clock::time_point deadline =
                     std::chrono::steady_clock::time_point::max());
    void touch();

    Connection conn_;
    std::mutex io_mutex_;
    std::atomic<bool> closing_{false};
    std::atomic<int64_t> last_received_ns_{0};

    std::string inbuf_;
    std::string fragments_;
    bool in_fragment_ = false;
};

} // namespace prisma
