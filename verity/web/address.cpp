/*
 * address.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-1-4

Description: Textual network address checks

**************************************************/

#include "address.hpp"

#ifdef _WIN32
#include <WS2tcpip.h>
#include <WinSock2.h>
#else
#include <arpa/inet.h>
#endif

#include <array>
#include <cstdint>
#include <regex>
#include <string>

#include <spdlog/spdlog.h>

namespace verity::web {
constexpr std::size_t IPV6_MAX_TEXT_LENGTH = 45;
constexpr int IPV6_BYTE_LENGTH = 16;

auto isValidIPv4(std::string_view address) -> bool {
    static const std::regex ipv4Regex(
        "^(25[0-5]|2[0-4][0-9]|[01]?[0-9][0-9]?)\\."
        "(25[0-5]|2[0-4][0-9]|[01]?[0-9][0-9]?)\\."
        "(25[0-5]|2[0-4][0-9]|[01]?[0-9][0-9]?)\\."
        "(25[0-5]|2[0-4][0-9]|[01]?[0-9][0-9]?)$");

    if (!std::regex_match(address.begin(), address.end(), ipv4Regex)) {
        spdlog::debug("Invalid IPv4 address format: {}", address);
        return false;
    }

    std::uint32_t ipValue = 0;
    if (inet_pton(AF_INET, std::string(address).c_str(), &ipValue) != 1) {
        spdlog::debug("IPv4 address conversion failed: {}", address);
        return false;
    }
    return true;
}

auto isValidIPv6(std::string_view address) -> bool {
    if (address.empty() || address.length() > IPV6_MAX_TEXT_LENGTH) {
        return false;
    }

    // Zone ids and CIDR suffixes are not part of the address grammar.
    if (address.find_first_of("%/") != std::string_view::npos) {
        return false;
    }

    int colonCount = 0;
    for (char c : address) {
        if (c == ':') {
            colonCount++;
        }
    }
    if (colonCount < 2 || colonCount > 8) {
        return false;
    }

    std::array<std::uint8_t, IPV6_BYTE_LENGTH> addrBuf{};
    if (inet_pton(AF_INET6, std::string(address).c_str(), addrBuf.data()) !=
        1) {
        spdlog::debug("Invalid IPv6 address: {}", address);
        return false;
    }
    return true;
}

}  // namespace verity::web
