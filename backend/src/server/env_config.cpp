#include "env_config.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

void load_env_file(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        // Try in backend directory if not found
        std::string backend_path = "backend/" + filepath;
        file.open(backend_path);
        if (!file.is_open()) {
            return; // .env file not found, will use system env vars
        }
    }

    std::string line;
    while (std::getline(file, line)) {
        // Skip empty lines and comments
        if (line.empty() || line[0] == '#') {
            continue;
        }

        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string key = line.substr(0, eq_pos);
        std::string value = line.substr(eq_pos + 1);

        // Trim whitespace
        key.erase(0, key.find_first_not_of(" \t"));
        key.erase(key.find_last_not_of(" \t") + 1);
        value.erase(0, value.find_first_not_of(" \t"));
        value.erase(value.find_last_not_of(" \t\r") + 1);

        // Remove quotes if present
        if (value.size() >= 2 && value[0] == '"' && value.back() == '"') {
            value = value.substr(1, value.length() - 2);
        }
        if (value.size() >= 2 && value[0] == '\'' && value.back() == '\'') {
            value = value.substr(1, value.length() - 2);
        }

        if (!key.empty()) {
            setenv(key.c_str(), value.c_str(), 0); // 0 = don't overwrite existing
        }
    }
}

std::vector<std::string> split_venue_list(const std::string& csv) {
    std::vector<std::string> out;
    std::string cur;
    auto flush = [&] {
        cur.erase(0, cur.find_first_not_of(" \t"));
        cur.erase(cur.find_last_not_of(" \t") + 1);
        if (!cur.empty()) out.push_back(cur);
        cur.clear();
    };
    for (char ch : csv) {
        if (ch == ',') {
            flush();
        } else {
            cur.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
        }
    }
    flush();
    return out;
}

static bool env_flag(const char* name, bool fallback) {
    const char* v = std::getenv(name);
    if (!v || !*v) return fallback;
    const std::string s(v);
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    throw std::runtime_error(std::string(name) + ": expected a boolean, got '" + s + "'");
}

static unsigned long env_number(const char* name, unsigned long fallback) {
    const char* v = std::getenv(name);
    if (!v || !*v) return fallback;
    try {
        std::size_t used = 0;
        unsigned long n = std::stoul(v, &used);
        if (v[used] != '\0') throw std::invalid_argument(v);
        return n;
    } catch (const std::exception&) {
        throw std::runtime_error(std::string(name) + ": expected a number, got '" + v + "'");
    }
}

SessionConfig session_config_from_env() {
    SessionConfig cfg;

    if (const char* venues = std::getenv("DEPTH_VENUES")) {
        cfg.venues = split_venue_list(venues);
        if (cfg.venues.empty()) {
            throw std::runtime_error("DEPTH_VENUES: at least one venue is required");
        }
    }
    if (const char* symbol = std::getenv("DEPTH_SYMBOL"); symbol && *symbol) {
        cfg.symbol = symbol;
    }
    if (const char* window = std::getenv("DEPTH_WINDOW"); window && *window) {
        if (!parse_window(window, cfg.window)) {
            throw std::runtime_error(std::string("DEPTH_WINDOW: expected 1m|5m|15m|1h, got '") + window + "'");
        }
    }
    cfg.realtime       = env_flag("DEPTH_REALTIME", cfg.realtime);
    cfg.zones_enabled  = env_flag("DEPTH_ZONES", cfg.zones_enabled);
    cfg.snapshot_limit = env_number("DEPTH_SNAPSHOT_LIMIT", cfg.snapshot_limit);
    return cfg;
}

unsigned short http_port_from_env() {
    unsigned long port = env_number("DEPTH_HTTP_PORT", 8080);
    if (port == 0 || port > 65535) {
        throw std::runtime_error("DEPTH_HTTP_PORT out of range");
    }
    return static_cast<unsigned short>(port);
}
