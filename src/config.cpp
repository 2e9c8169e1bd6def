#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>

namespace prisma {

nlohmann::json Config::defaults_json() {
    return {
        {"server_url", "http://localhost:8081"},
        {"username", ""},
        {"http_timeout", 10},
        {"stream", {
            {"heartbeat_interval", 25},
            {"heartbeat_timeout", 10},
            {"connect_timeout", 10}
        }},
        {"ui", {
            {"color", true}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

static void read_seconds(const nlohmann::json& obj, const char* key, uint32_t& out) {
    if (obj.contains(key) && obj[key].is_number_unsigned() && obj[key].get<uint32_t>() > 0)
        out = obj[key].get<uint32_t>();
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;
    if (!j.is_object()) return cfg;

    if (j.contains("server_url") && j["server_url"].is_string() &&
        !j["server_url"].get<std::string>().empty())
        cfg.server_url = j["server_url"].get<std::string>();
    if (j.contains("username") && j["username"].is_string())
        cfg.username = j["username"].get<std::string>();
    read_seconds(j, "http_timeout", cfg.http_timeout);

    if (j.contains("stream") && j["stream"].is_object()) {
        auto& s = j["stream"];
        read_seconds(s, "heartbeat_interval", cfg.stream.heartbeat_interval);
        read_seconds(s, "heartbeat_timeout", cfg.stream.heartbeat_timeout);
        read_seconds(s, "connect_timeout", cfg.stream.connect_timeout);
    }

    if (j.contains("ui") && j["ui"].is_object()) {
        auto& u = j["ui"];
        if (u.contains("color") && u["color"].is_boolean())
            cfg.ui.color = u["color"].get<bool>();
    }
    return cfg;
}

Config Config::load_from(const std::string& config_path) {
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                if (atomic_write_file(config_path, j.dump(4) + "\n"))
                    std::cerr << "[config] Migrated config with new defaults: "
                              << config_path << "\n";
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Ignoring malformed " << config_path
                      << ": " << e.what() << "\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n"))
            std::cerr << "[config] Created default config: " << config_path << "\n";
    }

    return from_json(j);
}

Config Config::load() {
    Config cfg = load_from(expand_home("~/.prisma/config.json"));
    cfg.apply_env();
    return cfg;
}

void Config::apply_env() {
    if (const char* v = std::getenv("PRISMA_SERVER_URL"); v && *v)
        server_url = v;
    if (const char* v = std::getenv("PRISMA_USERNAME"); v && *v)
        username = v;
}

} // namespace prisma
