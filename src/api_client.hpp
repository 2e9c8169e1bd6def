#pragma once
#include "http.hpp"
#include "models.hpp"
#include <string>
#include <vector>

namespace prisma {

// REST client for the chat server. Throws ApiError subclasses (errors.hpp).
//
// login() must complete before the other calls; afterwards the client is
// read-only and may be shared by concurrent worker threads.
class ApiClient {
public:
    ApiClient(std::string base_url, HttpClient& http, long timeout_seconds = 10);

    // POST /api/login. Stores the user and session token. Throws AuthError.
    void login(const std::string& username, const std::string& password);

    // GET /api/categories. Server order. Throws LoadError.
    std::vector<ChannelCategory> get_categories();

    // GET /api/channels/{id}/messages. Newest first, as the server sends
    // them. Throws LoadError.
    std::vector<Message> get_messages(int64_t channel_id);

    // POST /api/messages; success is 201 Created. Throws SendError.
    void send_message(int64_t channel_id, const std::string& content);

    bool logged_in() const { return !token_.empty(); }
    const User& user() const { return user_; }
    const std::string& token() const { return token_; }
    const std::string& base_url() const { return base_url_; }

private:
    std::vector<Header> auth_headers(bool with_body) const;

    std::string base_url_;
    HttpClient& http_;
    long timeout_;
    User user_;
    std::string token_;
};

} // namespace prisma
