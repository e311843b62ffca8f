/*
 * combinators.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-4-5

Description: Validators and the boolean combinators that assemble them

**************************************************/

#ifndef VERITY_SCHEMA_COMBINATORS_HPP
#define VERITY_SCHEMA_COMBINATORS_HPP

#include <functional>
#include <string>
#include <vector>

#include "verity/schema/result.hpp"

namespace verity::schema {

/**
 * @brief A pure predicate over candidate values.
 */
using Validator = std::function<ValidationResult(const json&)>;

/**
 * @brief Validator that accepts every value.
 */
[[nodiscard]] auto valid() -> Validator;

/**
 * @brief Validator that rejects every value with the given message.
 */
[[nodiscard]] auto invalid(std::string message) -> Validator;

/**
 * @brief Conjunction. Applies every validator without short-circuiting and
 * flattens the results, so all violations are reported together.
 *
 * allOf({}) accepts everything.
 */
[[nodiscard]] auto allOf(std::vector<Validator> validators) -> Validator;

/**
 * @brief Disjunction. Accepts when at least one validator accepts,
 * otherwise reports the messages of every branch.
 */
[[nodiscard]] auto anyOf(std::vector<Validator> validators) -> Validator;

/**
 * @brief Exclusive disjunction. Accepts when exactly one validator accepts.
 */
[[nodiscard]] auto oneOf(std::vector<Validator> validators) -> Validator;

/**
 * @brief Negation. Accepts when the inner validator rejects; the inner
 * messages are discarded.
 */
[[nodiscard]] auto notOf(Validator validator) -> Validator;

inline constexpr const char* ANY_OF_EMPTY_MESSAGE =
    "Value does not match any schema in 'anyOf'";
inline constexpr const char* ONE_OF_NONE_MESSAGE =
    "Value does not match any schema in 'oneOf'";
inline constexpr const char* ONE_OF_MANY_MESSAGE =
    "Value matches more than one schema in 'oneOf'";
inline constexpr const char* NOT_MESSAGE =
    "Value must not match the schema in 'not'";

}  // namespace verity::schema

#endif  // VERITY_SCHEMA_COMBINATORS_HPP
