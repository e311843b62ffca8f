/*
 * format.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-4-5

Description: Registry of "format" keyword validators

**************************************************/

#include "format.hpp"

#include <utility>

#include <spdlog/spdlog.h>

#include "verity/error/exception.hpp"
#include "verity/web/address.hpp"

namespace verity::schema {

auto FormatRegistry::withDefaults() -> FormatRegistry {
    FormatRegistry registry;
    registry.registerFormat("ipv4", [](std::string_view value) {
        return web::isValidIPv4(value);
    });
    registry.registerFormat("ipv6", [](std::string_view value) {
        return web::isValidIPv6(value);
    });
    return registry;
}

auto FormatRegistry::registerFormat(std::string name, FormatValidator validator)
    -> FormatRegistry& {
    if (name.empty()) {
        THROW_INVALID_ARGUMENT("Format name must not be empty");
    }
    if (!validator) {
        THROW_INVALID_ARGUMENT("Validator for format '{}' must not be empty",
                               name);
    }

    spdlog::debug("Registering format validator: {}", name);
    formats_.insert_or_assign(std::move(name), std::move(validator));
    return *this;
}

auto FormatRegistry::contains(std::string_view name) const -> bool {
    return formats_.find(name) != formats_.end();
}

auto FormatRegistry::find(std::string_view name) const
    -> const FormatValidator* {
    auto it = formats_.find(name);
    if (it == formats_.end()) {
        return nullptr;
    }
    return &it->second;
}

auto FormatRegistry::names() const -> std::vector<std::string> {
    std::vector<std::string> result;
    result.reserve(formats_.size());
    for (const auto& [name, _] : formats_) {
        result.push_back(name);
    }
    return result;
}

}  // namespace verity::schema
