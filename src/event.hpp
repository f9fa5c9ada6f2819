#pragma once
#include <string>
#include <functional>

namespace eventsource {

constexpr const char* DEFAULT_EVENT_TYPE = "message";

// One application-level record reconstructed from a blank-line terminated
// block of frames.
struct Event {
    std::string type = DEFAULT_EVENT_TYPE;
    std::string data;
};

inline bool operator==(const Event& a, const Event& b) {
    return a.type == b.type && a.data == b.data;
}

// Listeners receive their own copy of the event.
using EventCallback = std::function<void(Event event)>;
using OpenCallback  = std::function<void()>;

enum class ReadyState {
    Connecting,
    Open,
    Closed
};

} // namespace eventsource
