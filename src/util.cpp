#include "util.hpp"

#include <cctype>
#include <cstdlib>

namespace eventsource {

std::string trim_left(const std::string& s) {
    size_t start = s.find_first_not_of(" \t");
    if (start == std::string::npos) return {};
    return s.substr(start);
}

std::string to_lower(const std::string& s) {
    std::string out = s;
    for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

std::string expand_home(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::string(home) + path.substr(1);
        }
    }
    return path;
}

} // namespace eventsource
