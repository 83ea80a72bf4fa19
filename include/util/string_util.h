///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file string_util.h
 * @brief Small string helpers shared by the registry, codec and engine
 *
 * Variable and event names are compared case-insensitively after trimming,
 * so every lookup table in the project keys on FoldKey(name).
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#pragma once

#include <algorithm>
#include <cctype>
#include <string>

namespace SimPreset {
namespace str_util {

inline bool IsSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

inline std::string Trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && IsSpace(s[start])) start++;
    size_t end = s.size();
    while (end > start && IsSpace(s[end - 1])) end--;
    return s.substr(start, end - start);
}

inline bool IsBlank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](char c) { return IsSpace(c); });
}

inline std::string ToUpper(std::string s) {
    for (char& c : s) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return s;
}

inline std::string ToLower(std::string s) {
    for (char& c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return s;
}

// Canonical key for case-insensitive, whitespace-insensitive lookups
inline std::string FoldKey(const std::string& s) {
    return ToUpper(Trim(s));
}

inline bool EqualsIgnoreCase(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::toupper(static_cast<unsigned char>(a[i])) != std::toupper(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

inline bool ContainsIgnoreCase(const std::string& haystack, const std::string& needle) {
    return ToLower(haystack).find(ToLower(needle)) != std::string::npos;
}

} // namespace str_util
} // namespace SimPreset
