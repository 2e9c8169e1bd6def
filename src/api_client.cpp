#include "api_client.hpp"
#include "errors.hpp"
#include <nlohmann/json.hpp>

namespace prisma {

static std::string status_text(const HttpResponse& resp) {
    if (resp.status_code == 0)
        return resp.error.empty() ? "request did not complete"
                                  : "request did not complete (" + resp.error + ")";
    return "HTTP " + std::to_string(resp.status_code);
}

ApiClient::ApiClient(std::string base_url, HttpClient& http, long timeout_seconds)
    : base_url_(std::move(base_url)), http_(http), timeout_(timeout_seconds)
{
    while (!base_url_.empty() && base_url_.back() == '/') base_url_.pop_back();
}

std::vector<Header> ApiClient::auth_headers(bool with_body) const {
    std::vector<Header> headers = {{"Authorization", "Bearer " + token_}};
    if (with_body) headers.push_back({"Content-Type", "application/json"});
    return headers;
}

void ApiClient::login(const std::string& username, const std::string& password) {
    nlohmann::json body = {{"username", username}, {"password", password}};
    auto resp = http_.post(base_url_ + "/api/login", body.dump(),
                           {{"Content-Type", "application/json"}}, timeout_);
    if (resp.status_code != 200)
        throw AuthError("login failed with status: " + status_text(resp));

    User user;
    std::string token;
    try {
        auto j = nlohmann::json::parse(resp.body);
        if (!parse_user(j, user))
            throw AuthError("failed to decode login response");
        if (j.contains("token") && j["token"].is_string())
            token = j["token"].get<std::string>();
    } catch (const nlohmann::json::exception& e) {
        throw AuthError(std::string("failed to decode login response: ") + e.what());
    }

    if (token.empty())
        throw AuthError("login successful, but no token was received from server");
    user_ = std::move(user);
    token_ = std::move(token);
}

std::vector<ChannelCategory> ApiClient::get_categories() {
    auto resp = http_.get(base_url_ + "/api/categories", auth_headers(false), timeout_);
    if (resp.status_code != 200)
        throw LoadError("failed to load categories: " + status_text(resp));

    std::vector<ChannelCategory> categories;
    try {
        if (!parse_categories(nlohmann::json::parse(resp.body), categories))
            throw LoadError("failed to decode categories");
    } catch (const nlohmann::json::exception& e) {
        throw LoadError(std::string("failed to decode categories: ") + e.what());
    }
    return categories;
}

std::vector<Message> ApiClient::get_messages(int64_t channel_id) {
    std::string url = base_url_ + "/api/channels/" + std::to_string(channel_id) + "/messages";
    auto resp = http_.get(url, auth_headers(false), timeout_);
    if (resp.status_code != 200)
        throw LoadError("failed to load messages for channel " +
                        std::to_string(channel_id) + ": " + status_text(resp));

    std::vector<Message> messages;
    try {
        if (!parse_messages(nlohmann::json::parse(resp.body), messages))
            throw LoadError("failed to decode messages");
    } catch (const nlohmann::json::exception& e) {
        throw LoadError(std::string("failed to decode messages: ") + e.what());
    }
    return messages;
}

void ApiClient::send_message(int64_t channel_id, const std::string& content) {
    nlohmann::json body = {{"channel_id", channel_id}, {"content", content}};
    auto resp = http_.post(base_url_ + "/api/messages", body.dump(),
                           auth_headers(true), timeout_);
    if (resp.status_code != 201) {
        std::string detail = status_text(resp);
        if (!resp.body.empty()) detail += " - " + resp.body;
        throw SendError("failed to send message: " + detail);
    }
}

} // namespace prisma
