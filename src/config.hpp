#pragma once
#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace prisma {

struct StreamConfig {
    uint32_t heartbeat_interval = 25; // seconds between client pings
    uint32_t heartbeat_timeout = 10;  // ping write + response deadline
    uint32_t connect_timeout = 10;
};

struct UiConfig {
    bool color = true;
};

struct Config {
    std::string server_url = "http://localhost:8081";
    std::string username;
    uint32_t http_timeout = 10;

    StreamConfig stream;
    UiConfig ui;

    // Load ~/.prisma/config.json (created with defaults when missing), then
    // apply environment overrides.
    static Config load();

    // Load a specific file without environment overrides. Missing keys are
    // merged in from the defaults and written back.
    static Config load_from(const std::string& path);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Typed view of a config document; wrong-typed keys keep the default.
    static Config from_json(const nlohmann::json& j);

    // PRISMA_SERVER_URL, PRISMA_USERNAME
    void apply_env();
};

} // namespace prisma
