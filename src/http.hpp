#pragma once
#include <string>
#include <vector>
#include <utility>
#include <atomic>

namespace prisma {

// Initialize HTTP subsystem (call once at startup).
// No-op on Linux (OpenSSL 1.1+ auto-initialises); initialises libcurl elsewhere.
void http_init();

// Cleanup HTTP subsystem (call once at shutdown).
void http_cleanup();

// Set a global abort flag checked by every in-flight request and by the
// event stream. Once it becomes true, blocking I/O gives up within ~1s.
void http_set_abort_flag(const std::atomic<bool>* flag);

using Header = std::pair<std::string, std::string>;

struct HttpResponse {
    long status_code = 0; // 0 = request never completed
    std::string body;
    std::string error;    // why the request did not complete
};

// Abstract HTTP client interface (injectable for testing)
class HttpClient {
public:
    virtual ~HttpClient() = default;
    virtual HttpResponse get(const std::string& url,
                             const std::vector<Header>& headers,
                             long timeout_seconds) = 0;
    virtual HttpResponse post(const std::string& url,
                              const std::string& body,
                              const std::vector<Header>& headers,
                              long timeout_seconds) = 0;
};

// Largest response body either client accepts.
constexpr size_t kMaxResponseBody = 8 * 1024 * 1024;

// Platform-specific concrete implementations.
// Only one is compiled per build target (CMakeLists.txt gates the source file).
#ifdef __linux__

// Linux: POSIX sockets + OpenSSL (no libcurl dependency)
class SocketHttpClient : public HttpClient {
public:
    HttpResponse get(const std::string& url,
                     const std::vector<Header>& headers,
                     long timeout_seconds) override;
    HttpResponse post(const std::string& url,
                      const std::string& body,
                      const std::vector<Header>& headers,
                      long timeout_seconds) override;

private:
    HttpResponse request(const std::string& method, const std::string& url,
                         const std::string& body, const std::vector<Header>& headers,
                         long timeout_seconds);
};
using PlatformHttpClient = SocketHttpClient;

#else

// macOS and others: libcurl
class CurlHttpClient : public HttpClient {
public:
    HttpResponse get(const std::string& url,
                     const std::vector<Header>& headers,
                     long timeout_seconds) override;
    HttpResponse post(const std::string& url,
                      const std::string& body,
                      const std::vector<Header>& headers,
                      long timeout_seconds) override;
};
using PlatformHttpClient = CurlHttpClient;

#endif

} // namespace prisma
