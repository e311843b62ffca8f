/*
 * keywords.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-4-5

Description: Validators for individual JSON Schema keywords

**************************************************/

#ifndef VERITY_SCHEMA_KEYWORDS_HPP
#define VERITY_SCHEMA_KEYWORDS_HPP

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "verity/schema/combinators.hpp"
#include "verity/schema/format.hpp"
#include "verity/schema/node.hpp"

namespace verity::schema {

// Every factory below returns a validator that only inspects the kinds of
// value its keyword applies to; other kinds are accepted.

/**
 * @brief "type": the value's kind must be one of the given tags. An empty
 * tag list rejects every value.
 */
[[nodiscard]] auto validateType(std::vector<PrimitiveType> types) -> Validator;

/**
 * @brief "enum": the value must equal one of the literals.
 */
[[nodiscard]] auto validateEnum(std::vector<json> values) -> Validator;

/**
 * @brief "maxLength": string length in code points must be <= maxLength.
 */
[[nodiscard]] auto validateMaxLength(std::size_t maxLength) -> Validator;

/**
 * @brief "minLength": string length in code points must be >= minLength.
 */
[[nodiscard]] auto validateMinLength(std::size_t minLength) -> Validator;

/**
 * @brief "pattern": the regular expression must match somewhere in the
 * string. A pattern that does not compile yields a failing validator.
 */
[[nodiscard]] auto validatePattern(const std::string& pattern) -> Validator;

/**
 * @brief "multipleOf": value / divisor must be integral. A non-positive
 * divisor yields a failing validator.
 */
[[nodiscard]] auto validateMultipleOf(double divisor) -> Validator;

/**
 * @brief "minimum", with boolean "exclusiveMinimum" selecting > over >=.
 */
[[nodiscard]] auto validateMinimum(double minimum, bool exclusive) -> Validator;

/**
 * @brief "maximum", with boolean "exclusiveMaximum" selecting < over <=.
 */
[[nodiscard]] auto validateMaximum(double maximum, bool exclusive) -> Validator;

[[nodiscard]] auto validateMinItems(std::size_t minItems) -> Validator;
[[nodiscard]] auto validateMaxItems(std::size_t maxItems) -> Validator;

/**
 * @brief "uniqueItems": no two array elements may be equal.
 */
[[nodiscard]] auto validateUniqueItems() -> Validator;

/**
 * @brief "items" given as a single schema: every element must satisfy it.
 */
[[nodiscard]] auto validateItems(Validator items) -> Validator;

/**
 * @brief "items" given as an array, with "additionalItems".
 *
 * Element i is checked against items[i]. Extra elements are checked against
 * additional when allowAdditional is set, otherwise each one is reported.
 */
[[nodiscard]] auto validateTupleItems(std::vector<Validator> items,
                                      bool allowAdditional,
                                      Validator additional) -> Validator;

[[nodiscard]] auto validateMaxProperties(std::size_t maxProperties)
    -> Validator;
[[nodiscard]] auto validateMinProperties(std::size_t minProperties)
    -> Validator;

/**
 * @brief "required": every listed key must be present.
 */
[[nodiscard]] auto validateRequired(std::vector<std::string> keys) -> Validator;

/**
 * @brief "properties", "patternProperties" and "additionalProperties".
 *
 * A key listed in properties is checked against its schema. A key matching
 * any pattern is additionally checked against that pattern's schema. A key
 * matched by neither goes to additional, or is reported when
 * allowAdditional is false.
 */
[[nodiscard]] auto validateProperties(
    std::vector<std::pair<std::string, Validator>> properties,
    std::vector<std::pair<std::string, Validator>> patternProperties,
    bool allowAdditional, Validator additional) -> Validator;

/**
 * @brief Schema form of "dependencies": when key is present the whole
 * object must satisfy dependency.
 */
[[nodiscard]] auto validateSchemaDependency(std::string key,
                                            Validator dependency) -> Validator;

/**
 * @brief Array form of "dependencies": when key is present every listed
 * key must be present too.
 */
[[nodiscard]] auto validatePropertyDependency(
    std::string key, std::vector<std::string> dependencies) -> Validator;

/**
 * @brief "format": string values must satisfy the registered predicate.
 */
[[nodiscard]] auto validateFormat(std::string name,
                                  FormatValidator format) -> Validator;

/**
 * @brief Renders a number for messages without trailing zeros
 * ("0", "2.5", "1e+100").
 */
[[nodiscard]] auto formatNumber(double number) -> std::string;

}  // namespace verity::schema

#endif  // VERITY_SCHEMA_KEYWORDS_HPP
