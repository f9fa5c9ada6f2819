#pragma once
#include <string>

namespace eventsource {

struct Endpoint {
    bool tls = false;
    std::string host;
    std::string port;
    std::string path; // includes leading / and query string
};

// Parse an http:// or https:// URL. Throws EndpointError when the scheme is
// missing or unsupported, the host is empty or the port is not 1-65535.
Endpoint parse_endpoint(const std::string& url);

// "host:port" as used in the Host request header (port omitted when default).
std::string host_header(const Endpoint& endpoint);

} // namespace eventsource
