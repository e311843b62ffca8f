/*
 * string.hpp
 *
 * Copyright (C) 2023-2024 Max Q. <contact@lightapt.com>
 */

/*************************************************

Date: 2023-11-10

Description: String helpers used for reference navigation

**************************************************/

#ifndef VERITY_UTILS_STRING_HPP
#define VERITY_UTILS_STRING_HPP

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace verity::utils {

/**
 * @brief Decodes a percent-encoded string.
 *
 * Unlike form decoding, '+' is kept as is.
 *
 * @param str The percent-encoded string to decode.
 * @return The decoded string.
 * @throws std::invalid_argument If the input contains an incomplete or
 * non-hexadecimal escape sequence.
 */
[[nodiscard]] auto urlDecode(std::string_view str) -> std::string;

/**
 * @brief Checks if the given string starts with the specified prefix.
 *
 * @param str The string to check.
 * @param prefix The prefix to search for.
 * @return true if the string starts with the prefix, otherwise false.
 * @throws None
 */
[[nodiscard]] auto startsWith(std::string_view str,
                              std::string_view prefix) -> bool;

/**
 * @brief Splits a string on a delimiter, keeping empty tokens.
 *
 * "a//b" yields {"a", "", "b"} and "" yields {""}.
 *
 * @param str The input string.
 * @param delimiter The delimiter.
 * @return The tokens in order.
 */
[[nodiscard("the result of splitString is not used")]]
auto splitString(std::string_view str,
                 char delimiter) -> std::vector<std::string>;

/**
 * @brief Replaces every occurrence of a substring.
 *
 * @param text The text to rewrite.
 * @param oldStr The substring to replace; must not be empty.
 * @param newStr The replacement.
 * @return The rewritten text.
 */
[[nodiscard]] auto replaceString(std::string_view text, std::string_view oldStr,
                                 std::string_view newStr) -> std::string;

/**
 * @brief Counts the Unicode code points of a UTF-8 string.
 *
 * Continuation bytes are not counted, so malformed input degrades to a
 * byte-oriented count rather than failing.
 */
[[nodiscard]] auto utf8Length(std::string_view str) noexcept -> std::size_t;

}  // namespace verity::utils

#endif  // VERITY_UTILS_STRING_HPP
