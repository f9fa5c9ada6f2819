#pragma once
#include <string>
#include <utility>
#include <vector>

namespace eventsource {

using Header = std::pair<std::string, std::string>;

struct ClientOptions {
    long connect_timeout_seconds = 10;
    bool verify_tls = true;
    std::vector<Header> headers; // sent with the GET request
    bool verbose = false;        // log stream termination to stderr
};

} // namespace eventsource
