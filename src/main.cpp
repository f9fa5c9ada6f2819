#include "config.hpp"
#include "errors.hpp"
#include "event_source.hpp"
#include <iostream>
#include <memory>
#include <string>
#include <cstring>
#include <thread>
#include <atomic>
#include <csignal>
#include <chrono>
#include <vector>

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int /*sig*/) {
    g_shutdown.store(true);
}

static void print_usage() {
    std::cout << "Usage: eventsource-tail [options] [URL]\n"
              << "\n"
              << "Print Server-Sent Events from URL until interrupted or the stream ends.\n"
              << "Output starts once listeners are attached; anything the server sends\n"
              << "in the first moments after connecting (including [open]) may be missed.\n"
              << "\n"
              << "Options:\n"
              << "  -e, --event NAME     Print events of type NAME (repeatable, default: message)\n"
              << "  -H, --header 'K: V'  Send an extra request header (repeatable)\n"
              << "  --config PATH        Config file (default: ~/.eventsource/config.json)\n"
              << "  --insecure           Skip TLS certificate verification\n"
              << "  -v, --verbose        Log connection state changes to stderr\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Environment variables:\n"
              << "  EVENTSOURCE_URL              Stream URL when none is given\n"
              << "  EVENTSOURCE_CONNECT_TIMEOUT  Connect timeout in seconds (default: 10)\n";
}

int main(int argc, char* argv[]) try {
    std::string config_path = eventsource::DEFAULT_CONFIG_PATH;
    std::string url;
    std::vector<std::string> events;
    std::vector<eventsource::Header> headers;
    bool insecure = false;
    bool verbose = false;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if ((std::strcmp(argv[i], "-e") == 0 || std::strcmp(argv[i], "--event") == 0) && i + 1 < argc) {
            events.emplace_back(argv[++i]);
        } else if ((std::strcmp(argv[i], "-H") == 0 || std::strcmp(argv[i], "--header") == 0) && i + 1 < argc) {
            std::string h = argv[++i];
            size_t colon = h.find(':');
            if (colon == std::string::npos) {
                std::cerr << "Invalid header (expected 'Name: value'): " << h << "\n";
                return 1;
            }
            size_t value_start = h.find_first_not_of(' ', colon + 1);
            headers.emplace_back(h.substr(0, colon),
                                 value_start == std::string::npos ? "" : h.substr(value_start));
        } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (std::strcmp(argv[i], "--insecure") == 0) {
            insecure = true;
        } else if (std::strcmp(argv[i], "-v") == 0 || std::strcmp(argv[i], "--verbose") == 0) {
            verbose = true;
        } else if (argv[i][0] != '-' && url.empty()) {
            url = argv[i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    auto config = eventsource::Config::load(config_path);

    // Override config with CLI args
    if (!url.empty()) config.url = url;
    if (!events.empty()) config.events = events;
    for (auto& h : headers) config.headers.push_back(std::move(h));
    if (insecure) config.verify_tls = false;
    if (verbose) config.verbose = true;
    if (config.events.empty()) config.events.emplace_back(eventsource::DEFAULT_EVENT_TYPE);

    if (config.url.empty()) {
        std::cerr << "Error: no URL given.\n";
        print_usage();
        return 1;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::unique_ptr<eventsource::EventSource> source;
    try {
        source = std::make_unique<eventsource::EventSource>(config.url, config.client_options());
    } catch (const eventsource::EndpointError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    } catch (const eventsource::ConnectionError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 3;
    }

    // Listeners attach after the worker has started; an open transition or
    // events the server sends before this point are not replayed.
    source->on_open([verbose = config.verbose]() {
        std::cout << "[open]" << std::endl;
        if (verbose) std::cerr << "[eventsource-tail] connection open\n";
    });
    for (const auto& type : config.events) {
        source->add_event_listener(type, [](eventsource::Event ev) {
            std::cout << ev.type << ": " << ev.data << std::endl;
        });
    }

    while (!g_shutdown.load() && !source->finished()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    bool remote_closed = source->finished() && !g_shutdown.load();
    source->close();
    if (config.verbose) {
        std::cerr << "[eventsource-tail] "
                  << (remote_closed ? "stream ended by server" : "interrupted") << "\n";
    }
    return remote_closed ? 4 : 0;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
