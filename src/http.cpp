// libcurl HTTP client for non-Linux builds. The event stream still runs on
// net/Connection, so both share the abort flag.
#include "http.hpp"
#include "net/connection.hpp"

#include <curl/curl.h>
#include <memory>
#include <string>

namespace prisma {

static const std::atomic<bool>* g_http_abort_flag = nullptr;

void http_init() {
    curl_global_init(CURL_GLOBAL_ALL);
}

void http_cleanup() {
    curl_global_cleanup();
}

void http_set_abort_flag(const std::atomic<bool>* flag) {
    g_http_abort_flag = flag;
    set_io_abort_flag(flag);
}

namespace {

// Called by curl ~once per second; non-zero aborts the transfer.
int progress_cb(void*, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    return g_http_abort_flag && g_http_abort_flag->load(std::memory_order_relaxed) ? 1 : 0;
}

size_t collect_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
    size_t total = size * nmemb;
    auto* body = static_cast<std::string*>(userdata);
    if (body->size() + total > kMaxResponseBody) return 0; // aborts with CURLE_WRITE_ERROR
    body->append(ptr, total);
    return total;
}

struct CurlDeleter {
    void operator()(CURL* c) const { curl_easy_cleanup(c); }
};
struct SlistDeleter {
    void operator()(curl_slist* l) const { curl_slist_free_all(l); }
};

HttpResponse perform(const std::string& url, const std::string* post_body,
                     const std::vector<Header>& headers, long timeout_seconds) {
    HttpResponse resp;
    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) {
        resp.error = "curl_easy_init failed";
        return resp;
    }

    curl_slist* raw = curl_slist_append(nullptr, "Accept: application/json");
    for (const auto& h : headers)
        raw = curl_slist_append(raw, (h.first + ": " + h.second).c_str());
    std::unique_ptr<curl_slist, SlistDeleter> hlist(raw);

    CURL* c = curl.get();
    curl_easy_setopt(c, CURLOPT_URL, url.c_str());
    curl_easy_setopt(c, CURLOPT_HTTPHEADER, hlist.get());
    curl_easy_setopt(c, CURLOPT_TIMEOUT, timeout_seconds);
    curl_easy_setopt(c, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(c, CURLOPT_PROTOCOLS_STR, "http,https");
    curl_easy_setopt(c, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(c, CURLOPT_XFERINFOFUNCTION, progress_cb);
    curl_easy_setopt(c, CURLOPT_WRITEFUNCTION, collect_body);
    curl_easy_setopt(c, CURLOPT_WRITEDATA, &resp.body);
    if (post_body) {
        curl_easy_setopt(c, CURLOPT_POST, 1L);
        curl_easy_setopt(c, CURLOPT_POSTFIELDS, post_body->c_str());
        curl_easy_setopt(c, CURLOPT_POSTFIELDSIZE, static_cast<long>(post_body->size()));
    } else {
        curl_easy_setopt(c, CURLOPT_HTTPGET, 1L);
    }

    CURLcode res = curl_easy_perform(c);
    if (res != CURLE_OK) {
        resp.body.clear();
        resp.error = curl_easy_strerror(res);
        return resp;
    }
    curl_easy_getinfo(c, CURLINFO_RESPONSE_CODE, &resp.status_code);
    return resp;
}

} // namespace

HttpResponse CurlHttpClient::get(const std::string& url,
                                 const std::vector<Header>& headers,
                                 long timeout_seconds) {
    return perform(url, nullptr, headers, timeout_seconds);
}

HttpResponse CurlHttpClient::post(const std::string& url,
                                  const std::string& body,
                                  const std::vector<Header>& headers,
                                  long timeout_seconds) {
    return perform(url, &body, headers, timeout_seconds);
}

} // namespace prisma
