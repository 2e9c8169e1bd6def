// Linux HTTP/HTTPS client using POSIX sockets + OpenSSL.
// One request per connection ("Connection: close"); the REST calls are
// short and infrequent.
#ifdef __linux__

#include "http.hpp"
#include "net/connection.hpp"
#include "util.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace prisma {

void http_init() {}
void http_cleanup() {}

void http_set_abort_flag(const std::atomic<bool>* flag) {
    set_io_abort_flag(flag);
}

namespace {

struct RequestFailed : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct ResponseHead {
    long status = 0;
    bool chunked = false;
    bool has_length = false;
    size_t content_length = 0;
};

std::string build_request(const std::string& method, const ParsedUrl& url,
                          const std::string& body, const std::vector<Header>& headers) {
    std::string req;
    req.reserve(256 + body.size());
    req += method + " " + url.path + " HTTP/1.1\r\n";
    bool default_port = url.port == (url.tls ? "443" : "80");
    req += "Host: " + url.host + (default_port ? "" : ":" + url.port) + "\r\n";
    req += "Accept: application/json\r\n";
    for (const auto& h : headers)
        req += h.first + ": " + h.second + "\r\n";
    if (method == "POST" || !body.empty())
        req += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    req += "Connection: close\r\n\r\n";
    req += body;
    return req;
}

// Buffered reader over a connection with an overall deadline.
class ResponseReader {
public:
    ResponseReader(Connection& conn, std::chrono::steady_clock::time_point deadline)
        : conn_(conn), deadline_(deadline) {}

    // False on EOF. Throws on error or timeout.
    bool fill() {
        char buf[4096];
        while (true) {
            if (std::chrono::steady_clock::now() >= deadline_)
                throw RequestFailed("timed out waiting for response");
            ssize_t n = conn_.try_read(buf, sizeof(buf));
            if (n == Connection::kWouldBlock) continue;
            if (n < 0) throw RequestFailed(io_aborted() ? "aborted" : "read failed");
            if (n == 0) return false;
            buffer_.append(buf, static_cast<size_t>(n));
            return true;
        }
    }

    // One CRLF-terminated line without its terminator.
    std::string line() {
        size_t pos;
        while ((pos = buffer_.find('\n')) == std::string::npos) {
            if (buffer_.size() > 16 * 1024) throw RequestFailed("response line too long");
            if (!fill()) throw RequestFailed("connection closed mid-response");
        }
        std::string out = buffer_.substr(0, pos);
        buffer_.erase(0, pos + 1);
        if (!out.empty() && out.back() == '\r') out.pop_back();
        return out;
    }

    void take(size_t n, std::string& out) {
        while (buffer_.size() < n)
            if (!fill()) throw RequestFailed("connection closed mid-body");
        out.append(buffer_, 0, n);
        buffer_.erase(0, n);
    }

    void take_rest(std::string& out) {
        while (fill())
            if (buffer_.size() > kMaxResponseBody) throw RequestFailed("response too large");
        out += buffer_;
        buffer_.clear();
    }

private:
    Connection& conn_;
    std::chrono::steady_clock::time_point deadline_;
    std::string buffer_;
};

ResponseHead read_head(ResponseReader& in) {
    ResponseHead head;
    // Skip interim 1xx responses.
    do {
        std::string status_line = in.line();
        size_t sp = status_line.find(' ');
        if (status_line.compare(0, 5, "HTTP/") != 0 || sp == std::string::npos)
            throw RequestFailed("malformed status line");
        head.status = std::strtol(status_line.c_str() + sp + 1, nullptr, 10);
        if (head.status < 100 || head.status > 599)
            throw RequestFailed("malformed status line");

        head.chunked = false;
        head.has_length = false;
        for (std::string line = in.line(); !line.empty(); line = in.line()) {
            size_t colon = line.find(':');
            if (colon == std::string::npos) continue;
            std::string name = to_lower(trim(line.substr(0, colon)));
            std::string value = to_lower(trim(line.substr(colon + 1)));
            if (name == "transfer-encoding") {
                head.chunked = value.find("chunked") != std::string::npos;
            } else if (name == "content-length") {
                head.has_length = true;
                head.content_length = std::strtoul(value.c_str(), nullptr, 10);
            }
        }
    } while (head.status < 200);

    if (head.has_length && head.content_length > kMaxResponseBody)
        throw RequestFailed("response too large");
    return head;
}

std::string read_body(ResponseReader& in, const ResponseHead& head) {
    std::string body;
    if (head.chunked) {
        while (true) {
            size_t chunk = std::strtoul(in.line().c_str(), nullptr, 16);
            if (chunk == 0) break;
            if (body.size() + chunk > kMaxResponseBody) throw RequestFailed("response too large");
            in.take(chunk, body);
            in.line(); // CRLF after chunk data
        }
    } else if (head.has_length) {
        in.take(head.content_length, body);
    } else {
        in.take_rest(body);
    }
    return body;
}

} // namespace

HttpResponse SocketHttpClient::request(const std::string& method,
                                       const std::string& url_str,
                                       const std::string& body,
                                       const std::vector<Header>& headers,
                                       long timeout_seconds) {
    HttpResponse resp;
    ParsedUrl url;
    try {
        url = parse_url(url_str);
    } catch (const std::exception& e) {
        resp.error = e.what();
        return resp;
    }
    if (url.scheme != "http" && url.scheme != "https") {
        resp.error = "unsupported scheme: " + url.scheme;
        return resp;
    }

    Connection conn;
    if (!conn.connect(url, timeout_seconds)) {
        resp.error = "connect to " + url.host + ":" + url.port + " failed";
        return resp;
    }

    std::string req = build_request(method, url, body, headers);
    if (!conn.write_all(req.data(), req.size(), timeout_seconds)) {
        resp.error = "write failed";
        return resp;
    }

    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::seconds(std::max(1L, timeout_seconds));
    ResponseReader in(conn, deadline);
    try {
        ResponseHead head = read_head(in);
        // 204 and 304 never carry a body.
        std::string payload = (head.status == 204 || head.status == 304)
            ? std::string() : read_body(in, head);
        resp.status_code = head.status;
        resp.body = std::move(payload);
    } catch (const RequestFailed& e) {
        resp.error = e.what();
    }
    return resp;
}

HttpResponse SocketHttpClient::get(const std::string& url,
                                   const std::vector<Header>& headers,
                                   long timeout_seconds) {
    return request("GET", url, "", headers, timeout_seconds);
}

HttpResponse SocketHttpClient::post(const std::string& url,
                                    const std::string& body,
                                    const std::vector<Header>& headers,
                                    long timeout_seconds) {
    return request("POST", url, body, headers, timeout_seconds);
}

} // namespace prisma

#endif // __linux__
