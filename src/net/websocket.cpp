#include "net/websocket.hpp"
#include "util.hpp"

#include <openssl/rand.h>

#include <cstdlib>
#include <stdexcept>

namespace prisma {

static constexpr int kPollSliceMs = 250;
static constexpr long kControlWriteTimeout = 10;

static int64_t steady_now_ns() {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}

static bool random_bytes(unsigned char* out, int len) {
    return RAND_bytes(out, len) == 1;
}

void WebSocket::touch() {
    last_received_ns_.store(steady_now_ns(), std::memory_order_relaxed);
}

std::chrono::steady_clock::time_point WebSocket::last_received() const {
    return std::chrono::steady_clock::time_point(
        std::chrono::nanoseconds(last_received_ns_.load(std::memory_order_relaxed)));
}

void WebSocket::shutdown() {
    closing_.store(true);
    conn_.shutdown();
}

// ── Handshake ──────────────────────────────────────────────────

bool WebSocket::connect(const std::string& url_str,
                        const std::vector<Header>& headers,
                        long timeout_seconds,
                        std::string& error) {
    ParsedUrl url;
    try {
        url = parse_url(url_str);
    } catch (const std::exception& e) {
        error = e.what();
        return false;
    }
    if (url.scheme != "ws" && url.scheme != "wss") {
        error = "not a websocket URL: " + url.scheme;
        return false;
    }

    if (closing_.load() || !conn_.connect(url, timeout_seconds)) {
        error = "connect to " + url.host + ":" + url.port + " failed";
        return false;
    }

    unsigned char nonce[16];
    if (!random_bytes(nonce, sizeof(nonce))) {
        error = "random generator failure";
        return false;
    }
    std::string key = base64_encode(nonce, sizeof(nonce));

    bool default_port = url.port == (url.tls ? "443" : "80");
    std::string req;
    req += "GET " + url.path + " HTTP/1.1\r\n";
    req += "Host: " + url.host + (default_port ? "" : ":" + url.port) + "\r\n";
    req += "Upgrade: websocket\r\n";
    req += "Connection: Upgrade\r\n";
    req += "Sec-WebSocket-Key: " + key + "\r\n";
    req += "Sec-WebSocket-Version: 13\r\n";
    for (const auto& h : headers)
        req += h.first + ": " + h.second + "\r\n";
    req += "\r\n";

    {
        std::lock_guard<std::mutex> lock(io_mutex_);
        if (!conn_.write_all(req.data(), req.size(), timeout_seconds)) {
            error = "handshake write failed";
            return false;
        }
    }
    return read_handshake(error, timeout_seconds, key);
}

bool WebSocket::read_handshake(std::string& error, long timeout_secs,
                               const std::string& key) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(timeout_secs);
    size_t header_end;
    while ((header_end = inbuf_.find("\r\n\r\n")) == std::string::npos) {
        if (inbuf_.size() > 64 * 1024) {
            error = "handshake response too large";
            return false;
        }
        ssize_t n = fill(deadline);
        if (n == Connection::kWouldBlock) {
            error = "handshake timed out";
            return false;
        }
        if (n <= 0) {
            error = "connection closed during handshake";
            return false;
        }
    }

    std::string head = inbuf_.substr(0, header_end);
    inbuf_.erase(0, header_end + 4);

    auto lines = split(head, '\n');
    if (lines.empty()) {
        error = "bad handshake";
        return false;
    }
    std::string status_line = trim(lines[0]);
    size_t sp = status_line.find(' ');
    long status = sp == std::string::npos
        ? 0 : std::strtol(status_line.c_str() + sp + 1, nullptr, 10);
    if (status != 101) {
        error = "bad handshake (HTTP status " + std::to_string(status) + ")";
        return false;
    }

    std::string accept;
    for (size_t i = 1; i < lines.size(); ++i) {
        size_t colon = lines[i].find(':');
        if (colon == std::string::npos) continue;
        if (to_lower(trim(lines[i].substr(0, colon))) == "sec-websocket-accept")
            accept = trim(lines[i].substr(colon + 1));
    }
    if (accept != ws_accept_key(key)) {
        error = "bad handshake (Sec-WebSocket-Accept mismatch)";
        return false;
    }

    touch();
    return true;
}

// ── I/O ────────────────────────────────────────────────────────

ssize_t WebSocket::fill(std::chrono::steady_clock::time_point deadline) {
    char buf[8192];
    while (true) {
        if (closing_.load() || io_aborted()) return -1;
        if (std::chrono::steady_clock::now() >= deadline) return Connection::kWouldBlock;
        int ready = conn_.wait_readable(kPollSliceMs);
        if (ready < 0) return -1;
        if (ready == 0) continue;

        ssize_t n;
        {
            std::lock_guard<std::mutex> lock(io_mutex_);
            n = conn_.try_read(buf, sizeof(buf));
        }
        if (n == Connection::kWouldBlock) continue;
        if (closing_.load()) return -1;
        if (n > 0) {
            inbuf_.append(buf, static_cast<size_t>(n));
            touch();
        }
        return n;
    }
}

bool WebSocket::send_frame(WsOpcode opcode, const std::string& payload,
                           long timeout_secs) {
    std::array<uint8_t, 4> mask{};
    if (!random_bytes(mask.data(), static_cast<int>(mask.size()))) return false;
    std::string frame = encode_ws_frame(opcode, payload, mask);

    std::lock_guard<std::mutex> lock(io_mutex_);
    if (closing_.load()) return false;
    return conn_.write_all(frame.data(), frame.size(), timeout_secs);
}

bool WebSocket::ping(long timeout_seconds, std::string& error) {
    if (!send_frame(WsOpcode::Ping, "", timeout_seconds)) {
        error = closing_.load() ? "connection shut down" : "write failed";
        return false;
    }
    return true;
}

StreamRead WebSocket::read() {
    StreamRead result;
    while (true) {
        WsFrame frame;
        size_t consumed = 0;
        WsParse parsed = parse_ws_frame(inbuf_, frame, consumed);

        if (parsed == WsParse::Invalid) {
            result.status = StreamRead::Status::Failed;
            result.error = "protocol error: malformed frame";
            return result;
        }

        if (parsed == WsParse::Incomplete) {
            ssize_t n = fill();
            if (n == 0) {
                result.status = StreamRead::Status::Closed;
                result.close_code = kWsCloseAbnormal;
                return result;
            }
            if (n < 0) {
                result.status = StreamRead::Status::Failed;
                result.error = closing_.load() ? "connection shut down" : "read failed";
                return result;
            }
            continue;
        }

        inbuf_.erase(0, consumed);

        switch (frame.opcode) {
        case WsOpcode::Ping:
            if (!send_frame(WsOpcode::Pong, frame.payload, kControlWriteTimeout)) {
                result.status = StreamRead::Status::Failed;
                result.error = "pong write failed";
                return result;
            }
            break;
        case WsOpcode::Pong:
            break;
        case WsOpcode::Close:
            result.status = StreamRead::Status::Closed;
            result.close_code = ws_close_code(frame.payload);
            // Echo the close; the peer may already be gone.
            send_frame(WsOpcode::Close, ws_close_payload(
                result.close_code == kWsCloseNoStatus ? kWsCloseNormal : result.close_code),
                1);
            return result;
        case WsOpcode::Text:
        case WsOpcode::Binary:
            if (in_fragment_) {
                result.status = StreamRead::Status::Failed;
                result.error = "protocol error: interleaved data frame";
                return result;
            }
            if (frame.fin) {
                result.status = StreamRead::Status::Message;
                result.data = std::move(frame.payload);
                return result;
            }
            in_fragment_ = true;
            fragments_ = std::move(frame.payload);
            break;
        case WsOpcode::Continuation:
            if (!in_fragment_) {
                result.status = StreamRead::Status::Failed;
                result.error = "protocol error: unexpected continuation";
                return result;
            }
            fragments_ += frame.payload;
            if (fragments_.size() > kWsMaxPayload) {
                result.status = StreamRead::Status::Failed;
                result.error = "message too large";
                return result;
            }
            if (frame.fin) {
                in_fragment_ = false;
                result.status = StreamRead::Status::Message;
                result.data = std::move(fragments_);
                fragments_.clear();
                return result;
            }
            break;
        }
    }
}

} // namespace prisma
