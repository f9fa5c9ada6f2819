#pragma once
#include <cstddef>
#include <sys/types.h>

namespace eventsource {

// Duplex byte stream handed out by a Connector. read_some() blocks; shutdown()
// may be called from another thread and must unblock a pending read.
class ByteStream {
public:
    virtual ~ByteStream() = default;

    // Returns >0 bytes read, 0 on end-of-stream, -1 on I/O error.
    virtual ssize_t read_some(char* buf, size_t len) = 0;

    virtual bool write_all(const char* buf, size_t len) = 0;

    // Shut down both directions. Safe to call more than once.
    virtual void shutdown() = 0;
};

} // namespace eventsource
