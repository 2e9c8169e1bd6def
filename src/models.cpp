#include "models.hpp"
#include "util.hpp"

namespace prisma {

// Field readers: absent or null leaves the target untouched; a present value
// of the wrong type fails.
static bool read_int(const nlohmann::json& j, const char* key, int64_t& out) {
    if (!j.contains(key) || j[key].is_null()) return true;
    if (!j[key].is_number_integer()) return false;
    out = j[key].get<int64_t>();
    return true;
}

static bool read_int(const nlohmann::json& j, const char* key, int& out) {
    int64_t v = out;
    if (!read_int(j, key, v)) return false;
    out = static_cast<int>(v);
    return true;
}

static bool read_string(const nlohmann::json& j, const char* key, std::string& out) {
    if (!j.contains(key) || j[key].is_null()) return true;
    if (!j[key].is_string()) return false;
    out = j[key].get<std::string>();
    return true;
}

bool parse_user(const nlohmann::json& j, User& out) {
    if (!j.is_object()) return false;
    User u;
    if (!read_int(j, "id", u.id) ||
        !read_string(j, "username", u.username) ||
        !read_string(j, "role", u.role) ||
        !read_string(j, "avatar_url", u.avatar_url))
        return false;
    out = std::move(u);
    return true;
}

bool parse_channel(const nlohmann::json& j, Channel& out) {
    if (!j.is_object()) return false;
    Channel c;
    if (!read_int(j, "id", c.id) ||
        !read_string(j, "name", c.name) ||
        !read_int(j, "category_id", c.category_id) ||
        !read_int(j, "position", c.position))
        return false;
    out = std::move(c);
    return true;
}

bool parse_category(const nlohmann::json& j, ChannelCategory& out) {
    if (!j.is_object()) return false;
    ChannelCategory cat;
    if (!read_int(j, "id", cat.id) ||
        !read_string(j, "name", cat.name) ||
        !read_int(j, "position", cat.position))
        return false;
    if (j.contains("channels") && !j["channels"].is_null()) {
        if (!j["channels"].is_array()) return false;
        for (const auto& cj : j["channels"]) {
            Channel c;
            if (!parse_channel(cj, c)) return false;
            cat.channels.push_back(std::move(c));
        }
    }
    out = std::move(cat);
    return true;
}

bool parse_message(const nlohmann::json& j, Message& out) {
    if (!j.is_object()) return false;
    // A message without identity or target channel cannot be placed.
    if (!j.contains("id") || !j["id"].is_number_integer()) return false;
    if (!j.contains("channel_id") || !j["channel_id"].is_number_integer()) return false;

    Message m;
    std::string created;
    if (!read_int(j, "id", m.id) ||
        !read_int(j, "channel_id", m.channel_id) ||
        !read_int(j, "user_id", m.user_id) ||
        !read_string(j, "username", m.username) ||
        !read_string(j, "content", m.content) ||
        !read_string(j, "created_at", created) ||
        !read_string(j, "avatar_url", m.avatar_url))
        return false;
    if (!created.empty() && !parse_rfc3339(created, m.created_at)) return false;
    out = std::move(m);
    return true;
}

template <typename T, typename Fn>
static bool parse_array(const nlohmann::json& j, std::vector<T>& out, Fn parse_one) {
    if (j.is_null()) {
        out.clear();
        return true;
    }
    if (!j.is_array()) return false;
    std::vector<T> items;
    items.reserve(j.size());
    for (const auto& e : j) {
        T item;
        if (!parse_one(e, item)) return false;
        items.push_back(std::move(item));
    }
    out = std::move(items);
    return true;
}

bool parse_categories(const nlohmann::json& j, std::vector<ChannelCategory>& out) {
    return parse_array(j, out, parse_category);
}

bool parse_messages(const nlohmann::json& j, std::vector<Message>& out) {
    return parse_array(j, out, parse_message);
}

bool parse_users(const nlohmann::json& j, std::vector<User>& out) {
    return parse_array(j, out, parse_user);
}

} // namespace prisma
