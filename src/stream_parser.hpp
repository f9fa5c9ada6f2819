#pragma once
#include "event.hpp"
#include <optional>
#include <string>

namespace eventsource {

// One "name: value" line.
struct Field {
    std::string name;
    std::string value;
};

// Split on the first ':' and strip leading blanks from the value. A line
// without ':' yields the whole line as name and an empty value.
Field parse_field(const std::string& line);

enum class LineResult {
    Nothing,    // line consumed, nothing to report
    Opened,     // header block finished, body begins
    EventReady  // a blank line completed an event; call take_event()
};

// Line-driven state machine: skip the HTTP header block, then assemble
// events from blank-line terminated field blocks.
class StreamParser {
public:
    enum class Phase { HeaderSkip, Body };

    LineResult consume(const std::string& line);

    // The event completed by the last EventReady result.
    Event take_event();

    Phase phase() const { return phase_; }
    bool has_pending() const { return pending_.has_value(); }

private:
    void apply(const Field& field);

    Phase phase_ = Phase::HeaderSkip;
    std::optional<Event> pending_;
    Event ready_;
};

} // namespace eventsource
