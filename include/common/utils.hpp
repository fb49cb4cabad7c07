#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

namespace utils {

// Quote a single word for a POSIX shell. Words made only of safe characters
// are returned unchanged so logged command lines stay readable.
inline std::string shellQuote(const std::string& str) {
    static const std::string safe =
        "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789@%+=:,./-_";
    if (!str.empty() && str.find_first_not_of(safe) == std::string::npos) {
        return str;
    }

    std::string result = "'";
    for (char c : str) {
        if (c == '\'') {
            result += "'\\''";
        } else {
            result += c;
        }
    }
    result += "'";
    return result;
}

inline std::string joinCommand(const std::vector<std::string>& argv) {
    std::string result;
    for (const auto& arg : argv) {
        if (!result.empty()) {
            result += ' ';
        }
        result += shellQuote(arg);
    }
    return result;
}

inline std::string trim(const std::string& str) {
    auto begin = std::find_if_not(str.begin(), str.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(str.rbegin(), str.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

inline std::string toLower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

} // namespace utils
