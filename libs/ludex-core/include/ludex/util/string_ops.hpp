#pragma once

/**
@file
@brief ASCII string helpers shared by the classifier, detector and title cleaner.
*/

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <string>
#include <string_view>

namespace util {

/// @brief Returns an ASCII lower-cased copy of the string. Non-ASCII bytes are left untouched.
inline std::string ToLower(std::string_view str) {
    std::string out{str};
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return out;
}

/// @brief Compares two strings for equality ignoring ASCII case.
inline bool EqualsIgnoreCase(std::string_view lhs, std::string_view rhs) {
    return lhs.size() == rhs.size() && std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b) {
               return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
           });
}

/// @brief Removes leading and trailing whitespace.
inline std::string_view Trim(std::string_view str) {
    const auto isSpace = [](unsigned char ch) { return std::isspace(ch) != 0; };
    while (!str.empty() && isSpace(str.front())) {
        str.remove_prefix(1);
    }
    while (!str.empty() && isSpace(str.back())) {
        str.remove_suffix(1);
    }
    return str;
}

/// @brief Returns the UTF-8 rendering of a path in a plain `std::string`.
inline std::string PathString(const std::filesystem::path &path) {
    const std::u8string u8 = path.u8string();
    return std::string{u8.begin(), u8.end()};
}

/// @brief Builds a path from a UTF-8 string.
inline std::filesystem::path PathFromString(std::string_view str) {
    return std::filesystem::path{std::u8string{str.begin(), str.end()}};
}

/// @brief Returns the UTF-8 rendering of a path's filename in a plain `std::string`.
inline std::string FileName(const std::filesystem::path &path) {
    return PathString(path.filename());
}

} // namespace util
