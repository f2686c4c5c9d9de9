/**
 * @file string_utils.cpp
 * @brief Common string utility functions implementation
 */

#include "pubid/utils/string_utils.h"
#include <algorithm>
#include <cctype>
#include <climits>

namespace pubid {
namespace utils {

std::string toLowerCase(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

std::string toUpperCase(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    return result;
}

std::string trim(const std::string& str) {
    size_t start = 0;
    while (start < str.length() && std::isspace(static_cast<unsigned char>(str[start]))) {
        ++start;
    }

    if (start == str.length()) {
        return "";
    }

    size_t end = str.length();
    while (end > start && std::isspace(static_cast<unsigned char>(str[end - 1]))) {
        --end;
    }

    return str.substr(start, end - start);
}

std::string join(const std::vector<std::string>& parts, const std::string& delimiter) {
    std::string result;
    for (size_t i = 0; i < parts.size(); i++) {
        if (i > 0) {
            result += delimiter;
        }
        result += parts[i];
    }
    return result;
}

bool startsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() &&
           str.compare(0, prefix.size(), prefix) == 0;
}

std::string replaceAll(const std::string& str, const std::string& from, const std::string& to) {
    if (from.empty()) {
        return str;
    }

    std::string result = str;
    size_t pos = 0;
    while ((pos = result.find(from, pos)) != std::string::npos) {
        result.replace(pos, from.length(), to);
        pos += to.length();
    }
    return result;
}

std::string normalizeKey(const std::string& str) {
    std::string key;
    key.reserve(str.size());
    for (char c : str) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc)) {
            key += static_cast<char>(std::toupper(uc));
        }
    }
    return key;
}

std::optional<int> parseNonNegativeInt(const std::string& str) {
    if (str.empty()) {
        return std::nullopt;
    }

    long long value = 0;
    for (char c : str) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        value = value * 10 + (c - '0');
        if (value > INT_MAX) {
            return std::nullopt;
        }
    }
    return static_cast<int>(value);
}

size_t countDigits(const std::string& str, size_t pos) {
    size_t count = 0;
    while (pos + count < str.size() &&
           std::isdigit(static_cast<unsigned char>(str[pos + count]))) {
        ++count;
    }
    return count;
}

} // namespace utils
} // namespace pubid
