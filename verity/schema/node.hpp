/*
 * node.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-4-5

Description: Typed representation of a JSON Schema node

**************************************************/

#ifndef VERITY_SCHEMA_NODE_HPP
#define VERITY_SCHEMA_NODE_HPP

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace verity::schema {

using json = nlohmann::json;

/**
 * @brief Primitive kinds a schema's "type" keyword can name.
 */
enum class PrimitiveType {
    OBJECT,
    ARRAY,
    STRING,
    INTEGER,
    NUMBER,
    BOOLEAN,
    NULL_VALUE
};

[[nodiscard]] auto primitiveTypeFromString(std::string_view name)
    -> std::optional<PrimitiveType>;

[[nodiscard]] auto toString(PrimitiveType type) -> std::string_view;

/**
 * @brief Checks whether a value is of the given kind. INTEGER accepts any
 * number without a fractional part.
 */
[[nodiscard]] auto matchesType(const json& value, PrimitiveType type) -> bool;

/**
 * @brief Renders a value for use inside a message.
 *
 * Invalid UTF-8 is replaced rather than rejected, and long renderings are
 * cut at a code point boundary and end with "...".
 */
[[nodiscard]] auto describeValue(const json& value) -> std::string;

struct SchemaNode;
using SchemaNodePtr = std::shared_ptr<const SchemaNode>;

/**
 * @brief One entry of the "dependencies" keyword.
 *
 * Exactly one of schema and required_keys is meaningful: schema is set for
 * the schema form, required_keys for the array form.
 */
struct Dependency {
    std::string key;
    SchemaNodePtr schema;
    std::vector<std::string> required_keys;
};

using NamedSchemas = std::vector<std::pair<std::string, SchemaNodePtr>>;

/**
 * @brief A schema node decoded from its JSON form.
 *
 * Every recognized keyword has its own field; an empty optional (or null
 * pointer) means the keyword is absent. Keywords whose value has the wrong
 * JSON shape are treated as absent.
 */
struct SchemaNode {
    // Set when the schema itself is a JSON boolean.
    std::optional<bool> boolean;

    std::optional<std::string> title;
    std::optional<std::string> description;

    std::optional<std::string> ref;
    std::optional<std::vector<PrimitiveType>> type;

    std::optional<std::vector<SchemaNodePtr>> all_of;
    std::optional<std::vector<SchemaNodePtr>> any_of;
    std::optional<std::vector<SchemaNodePtr>> one_of;
    SchemaNodePtr not_schema;

    std::optional<std::vector<json>> enum_values;

    std::optional<std::size_t> max_length;
    std::optional<std::size_t> min_length;
    std::optional<std::string> pattern;

    std::optional<double> multiple_of;
    std::optional<double> minimum;
    std::optional<double> maximum;
    bool exclusive_minimum{false};
    bool exclusive_maximum{false};
    std::optional<double> exclusive_minimum_bound;
    std::optional<double> exclusive_maximum_bound;

    std::optional<std::size_t> min_items;
    std::optional<std::size_t> max_items;
    bool unique_items{false};
    SchemaNodePtr items;
    std::optional<std::vector<SchemaNodePtr>> tuple_items;
    SchemaNodePtr additional_items;

    std::optional<std::size_t> max_properties;
    std::optional<std::size_t> min_properties;
    std::optional<std::vector<std::string>> required;
    std::optional<NamedSchemas> properties;
    std::optional<NamedSchemas> pattern_properties;
    SchemaNodePtr additional_properties;

    std::vector<Dependency> dependencies;

    std::optional<std::string> format;

    /**
     * @brief True when any of properties, patternProperties or
     * additionalProperties is present.
     */
    [[nodiscard]] auto hasPropertyKeywords() const noexcept -> bool {
        return properties.has_value() || pattern_properties.has_value() ||
               additional_properties != nullptr;
    }
};

/**
 * @brief Decodes a schema and all of its nested schemas in one pass.
 *
 * "$ref" values are kept as strings; they are resolved later against the
 * root document. Non-object, non-boolean input decodes to an empty node.
 */
[[nodiscard]] auto decodeSchema(const json& schema) -> SchemaNodePtr;

}  // namespace verity::schema

#endif  // VERITY_SCHEMA_NODE_HPP
