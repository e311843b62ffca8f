/*
 * result.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-4-5

Description: Outcome of validating a value against a schema

**************************************************/

#ifndef VERITY_SCHEMA_RESULT_HPP
#define VERITY_SCHEMA_RESULT_HPP

#include <span>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace verity::schema {

using json = nlohmann::json;

/**
 * @brief Either Valid or Invalid with an ordered, non-empty list of
 * messages.
 */
class ValidationResult {
public:
    /**
     * @brief Creates the Valid result.
     */
    [[nodiscard]] static auto valid() -> ValidationResult;

    /**
     * @brief Creates an Invalid result carrying a single message.
     */
    [[nodiscard]] static auto invalid(std::string message) -> ValidationResult;

    /**
     * @brief Creates an Invalid result from a list of messages.
     * @param messages Messages in encounter order
     * @throws error::InvalidArgument if messages is empty
     */
    [[nodiscard]] static auto fromErrors(std::vector<std::string> messages)
        -> ValidationResult;

    [[nodiscard]] auto isValid() const noexcept -> bool {
        return errors_.empty();
    }

    explicit operator bool() const noexcept { return isValid(); }

    /**
     * @brief Messages of an Invalid result; empty for Valid.
     */
    [[nodiscard]] auto errors() const noexcept
        -> const std::vector<std::string>& {
        return errors_;
    }

    /**
     * @brief Renders the result as {"valid": bool, "errors": [...]}.
     */
    [[nodiscard]] auto toJson() const -> json;

    auto operator==(const ValidationResult& other) const -> bool = default;

private:
    ValidationResult() = default;

    std::vector<std::string> errors_;
};

/**
 * @brief Reduces results into one.
 *
 * Valid when every member is valid, otherwise Invalid with the messages of
 * every invalid member concatenated in order.
 */
[[nodiscard]] auto flatten(std::span<const ValidationResult> results)
    -> ValidationResult;

}  // namespace verity::schema

#endif  // VERITY_SCHEMA_RESULT_HPP
