#pragma once
#include "byte_stream.hpp"
#include <memory>
#include <string>

namespace eventsource {

// Wraps the raw socket stream of an HTTP/1.1 response. The status line and
// headers pass through unchanged (the stream parser skips them); when the
// headers announce Transfer-Encoding: chunked the body is dechunked, so
// readers only ever see the event-stream bytes.
class HttpResponseStream : public ByteStream {
public:
    explicit HttpResponseStream(std::unique_ptr<ByteStream> inner);

    ssize_t read_some(char* buf, size_t len) override;
    bool write_all(const char* buf, size_t len) override;
    void shutdown() override;

    bool chunked() const { return chunked_; }

private:
    enum class Phase { Headers, Body, ChunkSize, ChunkData, ChunkEnd, Done };

    // Move decodable bytes from in_ to out_. Returns false on a malformed
    // chunk size line.
    bool decode();

    std::unique_ptr<ByteStream> inner_;
    Phase phase_ = Phase::Headers;
    bool chunked_ = false;
    size_t chunk_remaining_ = 0;
    std::string in_;  // raw bytes not yet decoded
    std::string out_; // decoded bytes not yet returned
};

} // namespace eventsource
