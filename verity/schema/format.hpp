/*
 * format.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-4-5

Description: Registry of "format" keyword validators

**************************************************/

#ifndef VERITY_SCHEMA_FORMAT_HPP
#define VERITY_SCHEMA_FORMAT_HPP

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace verity::schema {

/**
 * @brief Predicate deciding whether a string conforms to a named format.
 */
using FormatValidator = std::function<bool(std::string_view)>;

/**
 * @brief Maps "format" keyword values to their validators.
 *
 * A default-constructed registry is empty; withDefaults() provides the
 * built-in "ipv4" and "ipv6" entries. Callers may register additional
 * formats or replace existing ones before handing the registry to a
 * Schema.
 */
class FormatRegistry {
public:
    FormatRegistry() = default;

    /**
     * @brief Creates a registry holding the built-in formats.
     */
    [[nodiscard]] static auto withDefaults() -> FormatRegistry;

    /**
     * @brief Registers or replaces a format validator.
     * @param name Format name as it appears in the schema
     * @param validator Predicate over string values
     * @return *this, for chaining
     * @throws error::InvalidArgument if name is empty or validator is empty
     */
    auto registerFormat(std::string name,
                        FormatValidator validator) -> FormatRegistry&;

    [[nodiscard]] auto contains(std::string_view name) const -> bool;

    /**
     * @brief Looks up a format.
     * @return The validator, or nullptr when the format is unknown
     */
    [[nodiscard]] auto find(std::string_view name) const
        -> const FormatValidator*;

    [[nodiscard]] auto names() const -> std::vector<std::string>;

    [[nodiscard]] auto size() const noexcept -> std::size_t {
        return formats_.size();
    }

private:
    std::map<std::string, FormatValidator, std::less<>> formats_;
};

}  // namespace verity::schema

#endif  // VERITY_SCHEMA_FORMAT_HPP
