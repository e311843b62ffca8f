/*
 * result.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-4-5

Description: Outcome of validating a value against a schema

**************************************************/

#include "result.hpp"

#include <utility>

#include "verity/error/exception.hpp"

namespace verity::schema {

auto ValidationResult::valid() -> ValidationResult { return {}; }

auto ValidationResult::invalid(std::string message) -> ValidationResult {
    ValidationResult result;
    result.errors_.push_back(std::move(message));
    return result;
}

auto ValidationResult::fromErrors(std::vector<std::string> messages)
    -> ValidationResult {
    if (messages.empty()) {
        THROW_INVALID_ARGUMENT(
            "An invalid result needs at least one error message");
    }
    ValidationResult result;
    result.errors_ = std::move(messages);
    return result;
}

auto ValidationResult::toJson() const -> json {
    return {{"valid", isValid()}, {"errors", errors_}};
}

auto flatten(std::span<const ValidationResult> results) -> ValidationResult {
    std::vector<std::string> errors;
    for (const auto& result : results) {
        const auto& messages = result.errors();
        errors.insert(errors.end(), messages.begin(), messages.end());
    }
    if (errors.empty()) {
        return ValidationResult::valid();
    }
    return ValidationResult::fromErrors(std::move(errors));
}

}  // namespace verity::schema
