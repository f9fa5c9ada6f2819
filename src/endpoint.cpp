#include "endpoint.hpp"
#include "errors.hpp"
#include "util.hpp"

#include <cctype>

namespace eventsource {

static bool valid_port(const std::string& port) {
    if (port.empty() || port.size() > 5) return false;
    for (char c : port) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    int p = std::stoi(port);
    return p > 0 && p <= 65535;
}

Endpoint parse_endpoint(const std::string& url) {
    for (char c : url) {
        if (std::isspace(static_cast<unsigned char>(c)))
            throw EndpointError("invalid URL (whitespace): " + url);
    }

    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0)
        throw EndpointError("invalid URL (missing scheme): " + url);

    std::string scheme = to_lower(url.substr(0, scheme_end));
    Endpoint result;
    if (scheme == "https") {
        result.tls = true;
    } else if (scheme != "http") {
        throw EndpointError("unsupported URL scheme '" + scheme + "': " + url);
    }

    size_t host_start = scheme_end + 3;
    size_t path_start = url.find_first_of("/?#", host_start);
    std::string authority = (path_start == std::string::npos)
        ? url.substr(host_start)
        : url.substr(host_start, path_start - host_start);

    if (authority.find('@') != std::string::npos)
        throw EndpointError("credentials in URL are not supported: " + url);

    std::string rest = (path_start == std::string::npos) ? "" : url.substr(path_start);
    size_t fragment = rest.find('#');
    if (fragment != std::string::npos) rest.erase(fragment);
    if (rest.empty() || rest[0] != '/') rest.insert(0, "/");
    result.path = rest;

    // [v6addr]:port
    if (!authority.empty() && authority[0] == '[') {
        size_t close = authority.find(']');
        if (close == std::string::npos)
            throw EndpointError("invalid IPv6 host: " + url);
        result.host = authority.substr(1, close - 1);
        std::string tail = authority.substr(close + 1);
        if (!tail.empty()) {
            if (tail[0] != ':')
                throw EndpointError("invalid host: " + url);
            result.port = tail.substr(1);
        }
    } else {
        size_t colon = authority.find(':');
        if (colon != std::string::npos) {
            result.host = authority.substr(0, colon);
            result.port = authority.substr(colon + 1);
            if (result.port.empty())
                throw EndpointError("invalid port: " + url);
        } else {
            result.host = authority;
        }
    }

    if (result.host.empty())
        throw EndpointError("invalid URL (empty host): " + url);

    if (result.port.empty()) {
        result.port = result.tls ? "443" : "80";
    } else if (!valid_port(result.port)) {
        throw EndpointError("invalid port '" + result.port + "': " + url);
    }
    return result;
}

std::string host_header(const Endpoint& endpoint) {
    std::string host = endpoint.host.find(':') != std::string::npos
        ? "[" + endpoint.host + "]"
        : endpoint.host;
    const char* default_port = endpoint.tls ? "443" : "80";
    if (endpoint.port != default_port) host += ":" + endpoint.port;
    return host;
}

} // namespace eventsource
