#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <string>

namespace codetutor::utils {

inline std::chrono::system_clock::time_point Now() {
    return std::chrono::system_clock::now();
}

inline std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

inline std::string Trim(const std::string& value) {
    const auto begin = std::find_if(value.begin(), value.end(), [](unsigned char c) {
        return !std::isspace(c);
    });
    const auto end = std::find_if(value.rbegin(), value.rend(), [](unsigned char c) {
        return !std::isspace(c);
    }).base();
    if (begin >= end) {
        return {};
    }
    return std::string(begin, end);
}

inline std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

inline std::string MaskKey(const std::string& key) {
    if (key.size() <= 8) {
        return "****";
    }
    return key.substr(0, 4) + "****" + key.substr(key.size() - 4);
}

}  // namespace codetutor::utils
