#pragma once
#include "byte_stream.hpp"
#include "client_options.hpp"
#include "connector.hpp"
#include "event.hpp"
#include "listener_registry.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace eventsource {

// "CONNECTING", "OPEN" or "CLOSED".
const char* ready_state_name(ReadyState state);

// SSE client. The constructor connects synchronously and starts one
// background thread that reads, parses and dispatches events; every public
// method may be called from any thread.
//
// Remote end-of-stream does not change state(); use finished() to find out
// that the background thread has stopped. There is no reconnection.
class EventSource {
public:
    // Throws EndpointError for a malformed URL, ConnectionError when the
    // transport cannot be established. No thread is started on failure.
    explicit EventSource(const std::string& url, ClientOptions options = {});
    EventSource(const std::string& url, Connector& connector, ClientOptions options = {});
    ~EventSource();

    EventSource(const EventSource&)            = delete;
    EventSource& operator=(const EventSource&) = delete;

    void on_open(OpenCallback callback);
    void on_message(EventCallback callback);
    void add_event_listener(const std::string& type, EventCallback callback);

    ReadyState state() const;

    // Shut the transport down and move to Closed. Later calls are no-ops.
    // An event already handed to the dispatcher may still be delivered;
    // nothing read afterwards is.
    void close();

    // True once the background thread has exited.
    bool finished() const { return finished_.load(); }

    const std::string& url() const { return url_; }

private:
    void run();

    std::string url_;
    ClientOptions options_;
    ListenerRegistry listeners_;

    mutable std::mutex state_mutex_;
    ReadyState state_ = ReadyState::Connecting;

    std::unique_ptr<ByteStream> stream_;
    std::atomic<bool> finished_{false};
    std::thread worker_;
};

} // namespace eventsource
