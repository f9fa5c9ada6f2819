#include "stream_parser.hpp"
#include "util.hpp"

#include <utility>

namespace eventsource {

Field parse_field(const std::string& line) {
    size_t colon = line.find(':');
    if (colon == std::string::npos) return {line, ""};
    return {line.substr(0, colon), trim_left(line.substr(colon + 1))};
}

LineResult StreamParser::consume(const std::string& line) {
    if (phase_ == Phase::HeaderSkip) {
        if (!line.empty()) return LineResult::Nothing;
        phase_ = Phase::Body;
        return LineResult::Opened;
    }

    if (line.empty()) {
        // Stray blank lines (no pending event) are ignored.
        if (!pending_) return LineResult::Nothing;
        ready_ = std::move(*pending_);
        pending_.reset();
        return LineResult::EventReady;
    }

    if (line[0] == ':') return LineResult::Nothing; // comment

    apply(parse_field(line));
    return LineResult::Nothing;
}

Event StreamParser::take_event() {
    return std::move(ready_);
}

void StreamParser::apply(const Field& field) {
    if (!pending_) pending_.emplace();

    if (field.name == "event") {
        pending_->type = field.value;
    } else if (field.name == "data") {
        pending_->data = field.value;
    }
    // Unknown fields are ignored.
}

} // namespace eventsource
