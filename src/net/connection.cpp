#include "net/connection.hpp"

#include <openssl/err.h>

#include <sys/socket.h>
#include <sys/time.h>
#include <netdb.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <stdexcept>

// MSG_NOSIGNAL prevents SIGPIPE on Linux; macOS uses SO_NOSIGPIPE per-socket.
#ifndef MSG_NOSIGNAL
#define MSG_NOSIGNAL 0
#endif

namespace prisma {

static const std::atomic<bool>* g_io_abort_flag = nullptr;

void set_io_abort_flag(const std::atomic<bool>* flag) {
    g_io_abort_flag = flag;
}

bool io_aborted() {
    return g_io_abort_flag && g_io_abort_flag->load(std::memory_order_relaxed);
}

// ── URL parsing ────────────────────────────────────────────────

ParsedUrl parse_url(const std::string& url) {
    ParsedUrl result{};
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos)
        throw std::runtime_error("invalid URL: " + url);

    result.scheme = url.substr(0, scheme_end);
    for (auto& c : result.scheme)
        c = static_cast<char>(tolower(static_cast<unsigned char>(c)));
    if (result.scheme != "http" && result.scheme != "https" &&
        result.scheme != "ws" && result.scheme != "wss")
        throw std::runtime_error("unsupported URL scheme: " + result.scheme);
    result.tls = (result.scheme == "https" || result.scheme == "wss");

    size_t host_start = scheme_end + 3;
    size_t path_start = url.find_first_of("/?", host_start);
    std::string host_port = (path_start == std::string::npos)
        ? url.substr(host_start)
        : url.substr(host_start, path_start - host_start);

    if (path_start == std::string::npos) {
        result.path = "/";
    } else if (url[path_start] == '?') {
        result.path = "/" + url.substr(path_start);
    } else {
        result.path = url.substr(path_start);
    }

    size_t colon = host_port.rfind(':');
    if (colon != std::string::npos && host_port.find(']') == std::string::npos) {
        result.host = host_port.substr(0, colon);
        result.port = host_port.substr(colon + 1);
    } else {
        result.host = host_port;
        result.port = result.tls ? "443" : "80";
    }
    if (result.host.empty())
        throw std::runtime_error("invalid URL (missing host): " + url);
    if (result.port.empty())
        result.port = result.tls ? "443" : "80";
    return result;
}

// ── Connection ─────────────────────────────────────────────────

Connection::~Connection() {
    if (ssl_) { SSL_shutdown(ssl_); SSL_free(ssl_); }
    if (ctx_) SSL_CTX_free(ctx_);
    if (fd_ >= 0) ::close(fd_);
}

bool Connection::connect(const ParsedUrl& url, long timeout_secs) {
    struct addrinfo hints{};
    hints.ai_family   = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    if (getaddrinfo(url.host.c_str(), url.port.c_str(), &hints, &res) != 0)
        return false;

    bool connected = false;
    for (auto* ai = res; ai && !connected; ai = ai->ai_next) {
        fd_ = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd_ < 0) continue;

#ifdef SO_NOSIGPIPE  // macOS
        int opt = 1;
        ::setsockopt(fd_, SOL_SOCKET, SO_NOSIGPIPE, &opt, sizeof(opt));
#endif

        // Non-blocking connect so we can honour timeout_secs.
        int flags = fcntl(fd_, F_GETFL, 0);
        fcntl(fd_, F_SETFL, flags | O_NONBLOCK);

        int rc = ::connect(fd_, ai->ai_addr, ai->ai_addrlen);
        if (rc == 0) {
            fcntl(fd_, F_SETFL, flags);
            connected = true;
        } else if (errno == EINPROGRESS) {
            struct pollfd pfd{};
            pfd.fd = fd_;
            pfd.events = POLLOUT;
            rc = ::poll(&pfd, 1, static_cast<int>(timeout_secs * 1000));
            if (rc > 0) {
                int err = 0;
                socklen_t elen = sizeof(err);
                getsockopt(fd_, SOL_SOCKET, SO_ERROR, &err, &elen);
                if (err == 0) {
                    fcntl(fd_, F_SETFL, flags);
                    connected = true;
                }
            }
        }
        if (!connected) { ::close(fd_); fd_ = -1; }
    }
    freeaddrinfo(res);
    if (!connected) return false;

    // Use full timeout for TLS handshake, then switch to 1-second slices
    // so abort-flag checks work during body streaming.
    if (url.tls) {
        set_socket_timeout(timeout_secs);

        ctx_ = SSL_CTX_new(TLS_client_method());
        if (!ctx_) return false;
        SSL_CTX_set_verify(ctx_, SSL_VERIFY_PEER, nullptr);
        SSL_CTX_set_default_verify_paths(ctx_);
        SSL_CTX_set_min_proto_version(ctx_, TLS1_2_VERSION);

        ssl_ = SSL_new(ctx_);
        if (!ssl_) return false;
        SSL_set_fd(ssl_, fd_);
        SSL_set_tlsext_host_name(ssl_, url.host.c_str()); // SNI
        SSL_set1_host(ssl_, url.host.c_str());

        if (SSL_connect(ssl_) != 1) {
            ERR_clear_error();
            return false;
        }
    }

    set_socket_timeout(1);
    return true;
}

ssize_t Connection::try_read(char* buf, size_t len) {
    if (io_aborted()) return -1;

    if (ssl_) {
        int n = SSL_read(ssl_, buf, static_cast<int>(len));
        if (n > 0) return n;
        int err = SSL_get_error(ssl_, n);
        if (err == SSL_ERROR_ZERO_RETURN) return 0;
        if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE)
            return kWouldBlock;
        if (err == SSL_ERROR_SYSCALL &&
            (errno == EAGAIN || errno == EWOULDBLOCK))
            return kWouldBlock; // 1-second slice expired
        if (err == SSL_ERROR_SYSCALL && n == 0)
            return 0; // peer closed without close_notify
        ERR_clear_error();
        return -1;
    }

    ssize_t n = ::recv(fd_, buf, len, 0);
    if (n >= 0) return n;
    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) return kWouldBlock;
    return -1;
}

bool Connection::write_all(const char* buf, size_t len, long timeout_secs) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(timeout_secs);
    auto expired = [&]() {
        return timeout_secs > 0 && std::chrono::steady_clock::now() >= deadline;
    };

    while (len > 0) {
        if (io_aborted() || expired()) return false;
        ssize_t n;
        if (ssl_) {
            n = SSL_write(ssl_, buf, static_cast<int>(len));
            if (n <= 0) {
                int err = SSL_get_error(ssl_, static_cast<int>(n));
                if (err == SSL_ERROR_WANT_WRITE || err == SSL_ERROR_WANT_READ)
                    continue;
                if (err == SSL_ERROR_SYSCALL &&
                    (errno == EAGAIN || errno == EWOULDBLOCK))
                    continue;
                ERR_clear_error();
                return false;
            }
        } else {
            n = ::send(fd_, buf, len, MSG_NOSIGNAL);
            if (n < 0) {
                if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
                return false;
            }
        }
        buf += n;
        len -= static_cast<size_t>(n);
    }
    return true;
}

int Connection::wait_readable(int timeout_ms) {
    if (fd_ < 0) return -1;
    if (ssl_ && SSL_pending(ssl_) > 0) return 1;

    struct pollfd pfd{};
    pfd.fd = fd_;
    pfd.events = POLLIN;
    int rc = ::poll(&pfd, 1, timeout_ms);
    if (rc < 0) return errno == EINTR ? 0 : -1;
    if (rc == 0) return 0;
    return 1; // POLLHUP/POLLERR also surface through the next read
}

void Connection::shutdown() {
    if (fd_ >= 0) ::shutdown(fd_, SHUT_RDWR);
}

void Connection::set_socket_timeout(long secs) {
    struct timeval tv{secs, 0};
    setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(fd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

} // namespace prisma
