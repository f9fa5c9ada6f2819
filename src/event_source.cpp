#include "event_source.hpp"
#include "endpoint.hpp"
#include "line_reader.hpp"
#include "stream_parser.hpp"

#include <iostream>
#include <utility>

namespace eventsource {

const char* ready_state_name(ReadyState state) {
    switch (state) {
        case ReadyState::Connecting: return "CONNECTING";
        case ReadyState::Open:       return "OPEN";
        case ReadyState::Closed:     return "CLOSED";
    }
    return "UNKNOWN";
}

static Connector& default_connector() {
    static SocketConnector connector;
    return connector;
}

EventSource::EventSource(const std::string& url, ClientOptions options)
    : EventSource(url, default_connector(), std::move(options))
{}

EventSource::EventSource(const std::string& url, Connector& connector, ClientOptions options)
    : url_(url)
    , options_(std::move(options))
{
    Endpoint endpoint = parse_endpoint(url_);
    stream_ = connector.connect(endpoint, options_);
    worker_ = std::thread([this]() { run(); });
}

EventSource::~EventSource() {
    close();
    if (worker_.joinable()) worker_.join();
}

void EventSource::on_open(OpenCallback callback) {
    listeners_.add_open_listener(std::move(callback));
}

void EventSource::on_message(EventCallback callback) {
    add_event_listener(DEFAULT_EVENT_TYPE, std::move(callback));
}

void EventSource::add_event_listener(const std::string& type, EventCallback callback) {
    listeners_.add_listener(type, std::move(callback));
}

ReadyState EventSource::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

void EventSource::close() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ == ReadyState::Closed) return;
        state_ = ReadyState::Closed;
    }
    if (stream_) stream_->shutdown();
}

void EventSource::run() {
    LineReader reader(*stream_);
    StreamParser parser;

    while (auto line = reader.next_line()) {
        LineResult result = parser.consume(*line);
        if (result == LineResult::Nothing) continue;

        if (result == LineResult::Opened) {
            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                if (state_ == ReadyState::Closed) break;
                state_ = ReadyState::Open;
            }
            listeners_.dispatch_open();
        } else {
            Event event = parser.take_event();
            if (state() == ReadyState::Closed) break;
            listeners_.dispatch(event);
        }
    }

    if (options_.verbose) {
        std::cerr << "[eventsource] stream ended (" << ready_state_name(state())
                  << "): " << url_ << "\n";
    }
    finished_.store(true);
}

} // namespace eventsource
