#include "line_reader.hpp"

namespace eventsource {

std::optional<std::string> LineReader::next_line() {
    while (true) {
        size_t pos = buffer_.find('\n');
        if (pos != std::string::npos) {
            std::string line = buffer_.substr(0, pos);
            buffer_.erase(0, pos + 1);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return line;
        }
        if (done_) {
            // An unterminated tail is not a line.
            buffer_.clear();
            return std::nullopt;
        }

        char buf[4096];
        ssize_t n = stream_.read_some(buf, sizeof(buf));
        if (n <= 0) {
            done_ = true;
            continue;
        }
        buffer_.append(buf, static_cast<size_t>(n));
    }
}

} // namespace eventsource
