#pragma once
#include <string>

namespace eventsource {

// Strip leading spaces and tabs only
std::string trim_left(const std::string& s);

std::string to_lower(const std::string& s);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

} // namespace eventsource
