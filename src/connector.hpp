#pragma once
#include "byte_stream.hpp"
#include "client_options.hpp"
#include "endpoint.hpp"
#include <memory>
#include <string>

namespace eventsource {

// Abstract endpoint connector (injectable for testing).
// connect() returns an open stream positioned at the start of the HTTP
// response, or throws ConnectionError.
class Connector {
public:
    virtual ~Connector() = default;
    virtual std::unique_ptr<ByteStream> connect(const Endpoint& endpoint,
                                                const ClientOptions& options) = 0;
};

// POSIX sockets + OpenSSL. Sends "GET <path>" with
// Accept: text/event-stream and leaves the response unread.
class SocketConnector : public Connector {
public:
    std::unique_ptr<ByteStream> connect(const Endpoint& endpoint,
                                        const ClientOptions& options) override;
};

// Request head sent by SocketConnector.
std::string build_request(const Endpoint& endpoint, const ClientOptions& options);

} // namespace eventsource
