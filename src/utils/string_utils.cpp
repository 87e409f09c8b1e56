/**
 * @file string_utils.cpp
 * @brief Implementation of string manipulation and parsing helpers
 *
 * @date 2025
 */

#include "saferun/utils/string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <cstdlib>
#include <cerrno>

namespace saferun {
namespace utils {

// ============================================================================
// STRING MANIPULATION UTILITIES
// ============================================================================

// Trim whitespace
std::string StringUtils::Trim(const std::string& str) {
    auto start = std::find_if_not(str.begin(), str.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(str.rbegin(), str.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    return (start < end) ? std::string(start, end) : std::string();
}

// Convert to lowercase
std::string StringUtils::ToLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                  [](unsigned char c) { return std::tolower(c); });
    return result;
}

// Split string by delimiter
std::vector<std::string> StringUtils::Split(const std::string& str, char delimiter) {
    std::vector<std::string> tokens;
    std::string token;
    std::istringstream token_stream(str);

    while (std::getline(token_stream, token, delimiter)) {
        if (!token.empty()) {  // Skip empty tokens
            tokens.push_back(token);
        }
    }

    return tokens;
}

// Split by any whitespace
std::vector<std::string> StringUtils::SplitWhitespace(const std::string& str) {
    std::vector<std::string> tokens;
    std::istringstream iss(str);
    std::string token;

    while (iss >> token) {
        tokens.push_back(token);
    }

    return tokens;
}

// Join strings
std::string StringUtils::Join(const std::vector<std::string>& strings,
                             const std::string& delimiter) {
    if (strings.empty()) {
        return "";
    }

    std::ostringstream oss;
    oss << strings[0];

    for (std::size_t i = 1; i < strings.size(); ++i) {
        oss << delimiter << strings[i];
    }

    return oss.str();
}

bool StringUtils::StartsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() &&
           str.compare(0, prefix.size(), prefix) == 0;
}

bool StringUtils::EndsWith(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() &&
           str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool StringUtils::Contains(const std::string& str, const std::string& substring) {
    return str.find(substring) != std::string::npos;
}

// Iterative glob matcher with single-star backtracking
bool StringUtils::WildcardMatch(const std::string& pattern, const std::string& text) {
    const std::string p = ToLower(pattern);
    const std::string t = ToLower(text);

    std::size_t pi = 0, ti = 0;
    std::size_t star = std::string::npos, mark = 0;

    while (ti < t.size()) {
        if (pi < p.size() && (p[pi] == '?' || p[pi] == t[ti])) {
            ++pi;
            ++ti;
        } else if (pi < p.size() && p[pi] == '*') {
            star = pi++;
            mark = ti;
        } else if (star != std::string::npos) {
            pi = star + 1;
            ti = ++mark;
        } else {
            return false;
        }
    }

    while (pi < p.size() && p[pi] == '*') {
        ++pi;
    }
    return pi == p.size();
}

// Truncate string
std::string StringUtils::Truncate(const std::string& str,
                                 std::size_t max_length,
                                 const std::string& suffix) {
    if (str.length() <= max_length) {
        return str;
    }
    if (max_length <= suffix.length()) {
        return str.substr(0, max_length);
    }

    return str.substr(0, max_length - suffix.length()) + suffix;
}

// ============================================================================
// PARSING UTILITIES
// ============================================================================
// Numbers and sizes as printed by container runtimes and procfs

std::optional<std::uint64_t> StringUtils::ParseSizeBytes(const std::string& str) {
    std::string s = Trim(str);
    if (s.empty()) {
        return std::nullopt;
    }

    std::size_t split = 0;
    while (split < s.size() &&
           (std::isdigit(static_cast<unsigned char>(s[split])) || s[split] == '.')) {
        ++split;
    }
    if (split == 0) {
        return std::nullopt;
    }

    auto number = ParseDouble(s.substr(0, split));
    if (!number || *number < 0) {
        return std::nullopt;
    }

    std::string unit = ToLower(Trim(s.substr(split)));
    double multiplier = 1.0;
    if (unit.empty() || unit == "b") {
        multiplier = 1.0;
    } else if (unit == "kib") {
        multiplier = 1024.0;
    } else if (unit == "mib") {
        multiplier = 1024.0 * 1024.0;
    } else if (unit == "gib") {
        multiplier = 1024.0 * 1024.0 * 1024.0;
    } else if (unit == "kb" || unit == "k") {
        multiplier = 1000.0;
    } else if (unit == "mb" || unit == "m") {
        multiplier = 1000.0 * 1000.0;
    } else if (unit == "gb" || unit == "g") {
        multiplier = 1000.0 * 1000.0 * 1000.0;
    } else {
        return std::nullopt;
    }

    return static_cast<std::uint64_t>(*number * multiplier);
}

std::optional<double> StringUtils::ParseDouble(const std::string& str) {
    std::string s = Trim(str);
    if (!s.empty() && s.back() == '%') {
        s.pop_back();
    }
    if (s.empty()) {
        return std::nullopt;
    }

    errno = 0;
    char* end = nullptr;
    double value = std::strtod(s.c_str(), &end);
    if (errno != 0 || end != s.c_str() + s.size()) {
        return std::nullopt;
    }
    return value;
}

std::optional<long long> StringUtils::ParseInt(const std::string& str) {
    std::string s = Trim(str);
    if (s.empty()) {
        return std::nullopt;
    }

    errno = 0;
    char* end = nullptr;
    long long value = std::strtoll(s.c_str(), &end, 10);
    if (errno != 0 || end != s.c_str() + s.size()) {
        return std::nullopt;
    }
    return value;
}

} // namespace utils
} // namespace saferun
