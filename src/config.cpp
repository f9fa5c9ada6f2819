#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace eventsource {

nlohmann::json Config::defaults_json() {
    return {
        {"url", ""},
        {"connect_timeout", 10},
        {"verify_tls", true},
        {"verbose", false},
        {"headers", nlohmann::json::object()},
        {"events", nlohmann::json::array()}
    };
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;
    if (!j.is_object()) return cfg;

    if (j.contains("url") && j["url"].is_string())
        cfg.url = j["url"].get<std::string>();
    if (j.contains("connect_timeout") && j["connect_timeout"].is_number_unsigned() &&
        j["connect_timeout"].get<long>() > 0)
        cfg.connect_timeout = j["connect_timeout"].get<long>();
    if (j.contains("verify_tls") && j["verify_tls"].is_boolean())
        cfg.verify_tls = j["verify_tls"].get<bool>();
    if (j.contains("verbose") && j["verbose"].is_boolean())
        cfg.verbose = j["verbose"].get<bool>();

    if (j.contains("headers") && j["headers"].is_object()) {
        for (auto& [name, value] : j["headers"].items()) {
            if (value.is_string())
                cfg.headers.emplace_back(name, value.get<std::string>());
        }
    }

    if (j.contains("events") && j["events"].is_array()) {
        for (const auto& ev : j["events"]) {
            if (ev.is_string() && !ev.get<std::string>().empty())
                cfg.events.push_back(ev.get<std::string>());
        }
    }
    return cfg;
}

Config Config::load(const std::string& path) {
    std::string config_path = expand_home(path);
    nlohmann::json j = defaults_json();

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json parsed = nlohmann::json::parse(file);
            if (parsed.is_object()) {
                for (auto& [key, value] : parsed.items()) j[key] = value;
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Ignoring malformed config " << config_path
                      << ": " << e.what() << "\n";
        }
    }

    Config cfg = from_json(j);

    // Environment variables always override config file
    if (const char* v = std::getenv("EVENTSOURCE_URL"))
        cfg.url = v;
    if (const char* v = std::getenv("EVENTSOURCE_CONNECT_TIMEOUT")) {
        char* end = nullptr;
        long secs = std::strtol(v, &end, 10);
        if (end != v && *end == '\0' && secs > 0)
            cfg.connect_timeout = secs;
        else
            std::cerr << "[config] Ignoring invalid EVENTSOURCE_CONNECT_TIMEOUT: " << v << "\n";
    }

    return cfg;
}

ClientOptions Config::client_options() const {
    ClientOptions opts;
    opts.connect_timeout_seconds = connect_timeout;
    opts.verify_tls = verify_tls;
    opts.headers = headers;
    opts.verbose = verbose;
    return opts;
}

} // namespace eventsource
