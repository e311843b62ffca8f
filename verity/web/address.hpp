/*
 * address.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-1-4

Description: Textual network address checks

**************************************************/

#ifndef VERITY_WEB_ADDRESS_HPP
#define VERITY_WEB_ADDRESS_HPP

#include <string_view>

namespace verity::web {

/**
 * @brief Checks a dotted-quad IPv4 address such as "192.168.0.1".
 *
 * Each of the four octets must be a decimal number in [0, 255] with at most
 * three digits. Prefix lengths ("10.0.0.0/8") are rejected.
 */
[[nodiscard]] auto isValidIPv4(std::string_view address) -> bool;

/**
 * @brief Checks a textual IPv6 address such as "fe80::1" or "::ffff:1.2.3.4".
 *
 * Zone identifiers ("%eth0") and prefix lengths are rejected.
 */
[[nodiscard]] auto isValidIPv6(std::string_view address) -> bool;

}  // namespace verity::web

#endif  // VERITY_WEB_ADDRESS_HPP
