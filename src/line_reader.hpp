#pragma once
#include "byte_stream.hpp"
#include <optional>
#include <string>

namespace eventsource {

// Splits a byte stream into lines. Each call blocks until a full line is
// available; a trailing '\r' is removed. Returns std::nullopt once the stream
// has ended or failed. Bytes after the last '\n' are discarded at
// end-of-stream.
class LineReader {
public:
    explicit LineReader(ByteStream& stream) : stream_(stream) {}

    std::optional<std::string> next_line();

private:
    ByteStream& stream_;
    std::string buffer_;
    bool done_ = false;
};

} // namespace eventsource
