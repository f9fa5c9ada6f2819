#include "http_response_stream.hpp"
#include "util.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <utility>

namespace eventsource {

HttpResponseStream::HttpResponseStream(std::unique_ptr<ByteStream> inner)
    : inner_(std::move(inner))
{}

// Take one '\n'-terminated line (without the terminator and a trailing
// '\r') off the front of buf. Returns false if no full line is buffered.
static bool take_line(std::string& buf, std::string& line, std::string* raw = nullptr) {
    size_t pos = buf.find('\n');
    if (pos == std::string::npos) return false;
    if (raw) raw->append(buf, 0, pos + 1);
    line = buf.substr(0, pos);
    buf.erase(0, pos + 1);
    if (!line.empty() && line.back() == '\r') line.pop_back();
    return true;
}

bool HttpResponseStream::decode() {
    std::string line;
    while (true) {
        switch (phase_) {
            case Phase::Headers: {
                if (!take_line(in_, line, &out_)) return true;
                if (line.empty()) {
                    phase_ = chunked_ ? Phase::ChunkSize : Phase::Body;
                    break;
                }
                size_t colon = line.find(':');
                if (colon == std::string::npos) break;
                std::string name = to_lower(line.substr(0, colon));
                if (name == "transfer-encoding")
                    chunked_ = to_lower(line.substr(colon + 1)).find("chunked") != std::string::npos;
                break;
            }
            case Phase::Body:
                out_ += in_;
                in_.clear();
                return true;
            case Phase::ChunkSize: {
                if (!take_line(in_, line)) return true;
                // Chunk size is hex, may have extensions after ';'
                if (line.empty() || !std::isxdigit(static_cast<unsigned char>(line[0])))
                    return false;
                chunk_remaining_ = std::strtoul(line.c_str(), nullptr, 16);
                phase_ = chunk_remaining_ == 0 ? Phase::Done : Phase::ChunkData;
                break;
            }
            case Phase::ChunkData: {
                if (in_.empty()) return true;
                size_t take = std::min(chunk_remaining_, in_.size());
                out_.append(in_, 0, take);
                in_.erase(0, take);
                chunk_remaining_ -= take;
                if (chunk_remaining_ == 0) phase_ = Phase::ChunkEnd;
                break;
            }
            case Phase::ChunkEnd:
                // trailing \r\n after the chunk payload
                if (!take_line(in_, line)) return true;
                phase_ = Phase::ChunkSize;
                break;
            case Phase::Done:
                in_.clear();
                return true;
        }
    }
}

ssize_t HttpResponseStream::read_some(char* buf, size_t len) {
    while (out_.empty()) {
        if (phase_ == Phase::Done) return 0;

        char tmp[4096];
        ssize_t n = inner_->read_some(tmp, sizeof(tmp));
        if (n <= 0) return n;
        in_.append(tmp, static_cast<size_t>(n));
        if (!decode()) {
            phase_ = Phase::Done;
            return -1;
        }
    }

    size_t n = std::min(len, out_.size());
    std::memcpy(buf, out_.data(), n);
    out_.erase(0, n);
    return static_cast<ssize_t>(n);
}

bool HttpResponseStream::write_all(const char* buf, size_t len) {
    return inner_->write_all(buf, len);
}

void HttpResponseStream::shutdown() {
    inner_->shutdown();
}

} // namespace eventsource
