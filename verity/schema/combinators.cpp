/*
 * combinators.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-4-5

Description: Validators and the boolean combinators that assemble them

**************************************************/

#include "combinators.hpp"

#include <utility>

namespace verity::schema {

auto valid() -> Validator {
    return [](const json&) { return ValidationResult::valid(); };
}

auto invalid(std::string message) -> Validator {
    return [message = std::move(message)](const json&) {
        return ValidationResult::invalid(message);
    };
}

auto allOf(std::vector<Validator> validators) -> Validator {
    return [validators = std::move(validators)](const json& value) {
        std::vector<ValidationResult> results;
        results.reserve(validators.size());
        for (const auto& validator : validators) {
            results.push_back(validator(value));
        }
        return flatten(results);
    };
}

auto anyOf(std::vector<Validator> validators) -> Validator {
    return [validators = std::move(validators)](const json& value) {
        if (validators.empty()) {
            return ValidationResult::invalid(ANY_OF_EMPTY_MESSAGE);
        }

        std::vector<ValidationResult> results;
        results.reserve(validators.size());
        for (const auto& validator : validators) {
            auto result = validator(value);
            if (result.isValid()) {
                return result;
            }
            results.push_back(std::move(result));
        }
        return flatten(results);
    };
}

auto oneOf(std::vector<Validator> validators) -> Validator {
    return [validators = std::move(validators)](const json& value) {
        std::size_t matches = 0;
        for (const auto& validator : validators) {
            if (validator(value).isValid()) {
                ++matches;
            }
        }

        if (matches == 1) {
            return ValidationResult::valid();
        }
        if (matches == 0) {
            return ValidationResult::invalid(ONE_OF_NONE_MESSAGE);
        }
        return ValidationResult::invalid(ONE_OF_MANY_MESSAGE);
    };
}

auto notOf(Validator validator) -> Validator {
    return [validator = std::move(validator)](const json& value) {
        if (validator(value).isValid()) {
            return ValidationResult::invalid(NOT_MESSAGE);
        }
        return ValidationResult::valid();
    };
}

}  // namespace verity::schema
