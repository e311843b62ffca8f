/*
 * string.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2023-11-10

Description: String helpers used for reference navigation

**************************************************/

#include "string.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <format>
#include <stdexcept>

namespace verity::utils {

auto urlDecode(std::string_view str) -> std::string {
    try {
        if (str.empty()) {
            return {};
        }

        std::string result;
        result.reserve(str.size());

        for (size_t i = 0; i < str.size(); ++i) {
            if (str[i] == '%') {
                if (i + 2 >= str.size()) {
                    throw std::invalid_argument("Incomplete escape sequence");
                }
                if (std::isxdigit(static_cast<unsigned char>(str[i + 1])) ==
                        0 ||
                    std::isxdigit(static_cast<unsigned char>(str[i + 2])) ==
                        0) {
                    throw std::invalid_argument("Invalid escape sequence");
                }

                int value = 0;
                const std::from_chars_result res = std::from_chars(
                    str.data() + i + 1, str.data() + i + 3, value, 16);

                if (res.ec != std::errc() || res.ptr != str.data() + i + 3) {
                    throw std::invalid_argument("Invalid escape sequence");
                }

                result.push_back(static_cast<char>(value));
                i += 2;
            } else {
                result.push_back(str[i]);
            }
        }

        return result;
    } catch (const std::invalid_argument& e) {
        throw std::invalid_argument(
            std::format("URL decoding failed: {}", e.what()));
    }
}

auto startsWith(std::string_view str, std::string_view prefix) -> bool {
    return str.size() >= prefix.size() &&
           str.substr(0, prefix.size()) == prefix;
}

auto splitString(std::string_view str,
                 char delimiter) -> std::vector<std::string> {
    std::vector<std::string> tokens;

    const auto delimCount = std::ranges::count(str, delimiter);
    tokens.reserve(static_cast<size_t>(delimCount) + 1);

    size_t start = 0;
    while (true) {
        const size_t pos = str.find(delimiter, start);
        if (pos == std::string_view::npos) {
            tokens.emplace_back(str.substr(start));
            break;
        }
        tokens.emplace_back(str.substr(start, pos - start));
        start = pos + 1;
    }

    return tokens;
}

auto replaceString(std::string_view text, std::string_view oldStr,
                   std::string_view newStr) -> std::string {
    if (oldStr.empty()) {
        throw std::invalid_argument("Cannot replace an empty substring");
    }

    std::string result;
    result.reserve(text.size());

    size_t pos = 0;
    while (true) {
        const size_t found = text.find(oldStr, pos);
        if (found == std::string_view::npos) {
            result.append(text.substr(pos));
            break;
        }
        result.append(text.substr(pos, found - pos));
        result.append(newStr);
        pos = found + oldStr.size();
    }

    return result;
}

auto utf8Length(std::string_view str) noexcept -> std::size_t {
    return static_cast<std::size_t>(std::ranges::count_if(str, [](char c) {
        return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
    }));
}

}  // namespace verity::utils
