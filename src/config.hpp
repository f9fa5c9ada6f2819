#pragma once
#include "client_options.hpp"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace eventsource {

constexpr const char* DEFAULT_CONFIG_PATH = "~/.eventsource/config.json";

struct Config {
    std::string url;
    long connect_timeout = 10; // seconds
    bool verify_tls = true;
    bool verbose = false;
    std::vector<Header> headers;     // extra request headers
    std::vector<std::string> events; // event types to print (empty = "message")

    // Load from path (default ~/.eventsource/config.json) + env vars.
    // A missing or malformed file yields the defaults.
    static Config load(const std::string& path = DEFAULT_CONFIG_PATH);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Apply the keys present in j; unknown or mistyped keys are ignored.
    static Config from_json(const nlohmann::json& j);

    ClientOptions client_options() const;
};

} // namespace eventsource
