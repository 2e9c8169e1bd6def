#pragma once
#include <atomic>
#include <string>
#include <sys/types.h>

#include <openssl/ssl.h>

namespace prisma {

// Global abort flag consulted by every blocking read/write slice.
void set_io_abort_flag(const std::atomic<bool>* flag);
bool io_aborted();

struct ParsedUrl {
    bool tls = false;
    std::string scheme;
    std::string host;
    std::string port;
    std::string path; // includes leading / and query string
};

// Split an http(s):// or ws(s):// URL. Throws std::runtime_error if malformed.
ParsedUrl parse_url(const std::string& url);

// ── RAII connection (TCP + optional TLS) ──────────────────────
//
// Body I/O runs on 1-second socket timeouts so blocking calls can notice
// the abort flag. Not internally synchronized: concurrent users must
// serialize read/write calls themselves (shutdown() is the exception).
class Connection {
public:
    // try_read() result when the slice expired without data.
    static constexpr ssize_t kWouldBlock = -2;

    Connection() = default;
    ~Connection();
    Connection(const Connection&)            = delete;
    Connection& operator=(const Connection&) = delete;

    bool connect(const ParsedUrl& url, long timeout_secs);

    // Single read attempt; returns kWouldBlock when the 1s slice expires.
    ssize_t try_read(char* buf, size_t len);

    // Write everything. timeout_secs > 0 bounds the total time spent.
    bool write_all(const char* buf, size_t len, long timeout_secs = 0);

    // Wait until the socket (or TLS buffer) has readable data.
    // Returns 1 ready, 0 timeout, -1 error.
    int wait_readable(int timeout_ms);

    // Unblock any pending reader; safe to call from another thread.
    void shutdown();

private:
    void set_socket_timeout(long secs);

    std::atomic<int> fd_{-1};
    SSL_CTX* ctx_ = nullptr;
    SSL*     ssl_ = nullptr;
};

} // namespace prisma
