#pragma once
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace prisma {

struct User {
    int64_t id = 0;
    std::string username;
    std::string role;
    std::string avatar_url;
};

struct Channel {
    int64_t id = 0;
    std::string name;
    int64_t category_id = 0;
    int position = 0;
};

struct ChannelCategory {
    int64_t id = 0;
    std::string name;
    int position = 0;
    std::vector<Channel> channels;
};

struct Message {
    int64_t id = 0;
    int64_t channel_id = 0;
    int64_t user_id = 0;
    std::string username;
    std::string content;
    int64_t created_at = 0; // Unix epoch seconds
    std::string avatar_url; // empty when absent
};

// JSON decoding. Each returns false when j does not match the schema: a
// field present with the wrong type, or a required field missing. Optional
// fields that are absent keep their defaults.
bool parse_user(const nlohmann::json& j, User& out);
bool parse_channel(const nlohmann::json& j, Channel& out);
bool parse_category(const nlohmann::json& j, ChannelCategory& out);
bool parse_message(const nlohmann::json& j, Message& out);

// Arrays: every element must decode, otherwise the whole array is rejected.
bool parse_categories(const nlohmann::json& j, std::vector<ChannelCategory>& out);
bool parse_messages(const nlohmann::json& j, std::vector<Message>& out);
bool parse_users(const nlohmann::json& j, std::vector<User>& out);

} // namespace prisma
