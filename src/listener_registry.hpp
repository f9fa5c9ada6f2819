#pragma once
#include "event.hpp"
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace eventsource {

// Event-type name -> ordered callbacks, plus the open callbacks.
// Append-only; callbacks run in registration order.
class ListenerRegistry {
public:
    void add_listener(const std::string& type, EventCallback callback);
    void add_open_listener(OpenCallback callback);

    // Invoke every listener for event.type, each with its own copy.
    // Unknown types are dropped. The mutex is released before calling
    // listeners, so listeners may register further listeners.
    void dispatch(const Event& event) const;

    void dispatch_open() const;

    size_t listener_count(const std::string& type) const;
    size_t open_listener_count() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::vector<EventCallback>> listeners_;
    std::vector<OpenCallback> open_listeners_;
};

} // namespace eventsource
