#pragma once
#include <string>

// Leading/trailing ASCII whitespace removed (space, \t, \n, \v, \f, \r).
inline std::string trim_copy(const std::string& s) {
    const char* ws = " \t\n\v\f\r";
    const auto first = s.find_first_not_of(ws);
    if (first == std::string::npos) return {};
    const auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}
