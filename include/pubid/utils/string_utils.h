/**
 * @file string_utils.h
 * @brief String manipulation utilities
 *
 * Common string operations used by the registry, parser and renderer.
 *
 * @version 1.0.0
 * @date 2026-10-18
 */

#pragma once

#include <string>
#include <vector>
#include <optional>

namespace pubid {
namespace utils {

/**
 * @brief Convert string to lowercase
 */
std::string toLowerCase(const std::string& str);

/**
 * @brief Convert string to uppercase
 */
std::string toUpperCase(const std::string& str);

/**
 * @brief Trim whitespace from both ends
 *
 * @param str Input string
 * @return Trimmed string
 */
std::string trim(const std::string& str);

/**
 * @brief Join strings with delimiter
 */
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

/**
 * @brief Check if string starts with prefix
 */
bool startsWith(const std::string& str, const std::string& prefix);

/**
 * @brief Replace all occurrences of substring
 */
std::string replaceAll(const std::string& str, const std::string& from, const std::string& to);

/**
 * @brief Build a case- and punctuation-insensitive lookup key
 *
 * Upper-cases the input and drops every character that is not an ASCII
 * letter or digit.
 *
 * @example
 * normalizeKey("fips.pub");   // "FIPSPUB"
 * normalizeKey("CRPL-F-B");   // "CRPLFB"
 */
std::string normalizeKey(const std::string& str);

/**
 * @brief Parse a non-negative decimal integer
 *
 * @param str Digits only; no sign, no whitespace
 * @return Value, or std::nullopt if str is empty, has a non-digit or overflows int
 */
std::optional<int> parseNonNegativeInt(const std::string& str);

/**
 * @brief Count leading characters of str (from pos) that are ASCII digits
 */
size_t countDigits(const std::string& str, size_t pos = 0);

} // namespace utils
} // namespace pubid
