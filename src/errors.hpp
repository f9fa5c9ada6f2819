#pragma once
#include <stdexcept>
#include <string>

namespace eventsource {

// Malformed endpoint URL. Thrown synchronously while opening a client.
class EndpointError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The transport could not be established (DNS, connect, TLS handshake,
// request write). Thrown synchronously while opening a client.
class ConnectionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace eventsource
