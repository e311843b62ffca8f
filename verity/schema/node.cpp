/*
 * node.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-4-5

Description: Typed representation of a JSON Schema node

**************************************************/

#include "node.hpp"

#include <cmath>
#include <cstdint>
#include <limits>

#include <spdlog/spdlog.h>

namespace verity::schema {

namespace {
constexpr std::size_t MAX_DESCRIBED_LENGTH = 64;
}  // namespace

auto primitiveTypeFromString(std::string_view name)
    -> std::optional<PrimitiveType> {
    if (name == "object")
        return PrimitiveType::OBJECT;
    if (name == "array")
        return PrimitiveType::ARRAY;
    if (name == "string")
        return PrimitiveType::STRING;
    if (name == "integer")
        return PrimitiveType::INTEGER;
    if (name == "number")
        return PrimitiveType::NUMBER;
    if (name == "boolean")
        return PrimitiveType::BOOLEAN;
    if (name == "null")
        return PrimitiveType::NULL_VALUE;
    return std::nullopt;
}

auto toString(PrimitiveType type) -> std::string_view {
    switch (type) {
        case PrimitiveType::OBJECT:
            return "object";
        case PrimitiveType::ARRAY:
            return "array";
        case PrimitiveType::STRING:
            return "string";
        case PrimitiveType::INTEGER:
            return "integer";
        case PrimitiveType::NUMBER:
            return "number";
        case PrimitiveType::BOOLEAN:
            return "boolean";
        case PrimitiveType::NULL_VALUE:
            return "null";
    }
    return "unknown";
}

auto matchesType(const json& value, PrimitiveType type) -> bool {
    switch (type) {
        case PrimitiveType::OBJECT:
            return value.is_object();
        case PrimitiveType::ARRAY:
            return value.is_array();
        case PrimitiveType::STRING:
            return value.is_string();
        case PrimitiveType::INTEGER:
            if (value.is_number_integer()) {
                return true;
            }
            if (value.is_number_float()) {
                const auto number = value.get<double>();
                return std::isfinite(number) && std::trunc(number) == number;
            }
            return false;
        case PrimitiveType::NUMBER:
            return value.is_number();
        case PrimitiveType::BOOLEAN:
            return value.is_boolean();
        case PrimitiveType::NULL_VALUE:
            return value.is_null();
    }
    return false;
}

auto describeValue(const json& value) -> std::string {
    auto text = value.dump(-1, ' ', false, json::error_handler_t::replace);
    if (text.size() <= MAX_DESCRIBED_LENGTH) {
        return text;
    }

    std::size_t cut = MAX_DESCRIBED_LENGTH;
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    text.resize(cut);
    text += "...";
    return text;
}

namespace {

void warnIgnored(const char* keyword, const json& value) {
    spdlog::warn("Ignoring schema keyword '{}' with unexpected value {}",
                 keyword, describeValue(value));
}

auto findKeyword(const json& schema, const char* keyword) -> const json* {
    auto it = schema.find(keyword);
    if (it == schema.end()) {
        return nullptr;
    }
    return &*it;
}

auto decodeString(const json& schema,
                  const char* keyword) -> std::optional<std::string> {
    const json* value = findKeyword(schema, keyword);
    if (value == nullptr) {
        return std::nullopt;
    }
    if (!value->is_string()) {
        warnIgnored(keyword, *value);
        return std::nullopt;
    }
    return value->get<std::string>();
}

auto decodeNumber(const json& schema,
                  const char* keyword) -> std::optional<double> {
    const json* value = findKeyword(schema, keyword);
    if (value == nullptr) {
        return std::nullopt;
    }
    if (!value->is_number()) {
        warnIgnored(keyword, *value);
        return std::nullopt;
    }
    return value->get<double>();
}

auto decodeCount(const json& schema,
                 const char* keyword) -> std::optional<std::size_t> {
    const json* value = findKeyword(schema, keyword);
    if (value == nullptr) {
        return std::nullopt;
    }
    if (value->is_number_unsigned()) {
        return value->get<std::size_t>();
    }
    if (value->is_number_integer() && value->get<std::int64_t>() >= 0) {
        return static_cast<std::size_t>(value->get<std::int64_t>());
    }
    if (value->is_number_float()) {
        const auto number = value->get<double>();
        if (number >= 0 && std::trunc(number) == number &&
            number < static_cast<double>(
                         std::numeric_limits<std::size_t>::max())) {
            return static_cast<std::size_t>(number);
        }
    }
    warnIgnored(keyword, *value);
    return std::nullopt;
}

auto decodeStringList(const json& schema, const char* keyword)
    -> std::optional<std::vector<std::string>> {
    const json* value = findKeyword(schema, keyword);
    if (value == nullptr) {
        return std::nullopt;
    }
    if (!value->is_array()) {
        warnIgnored(keyword, *value);
        return std::nullopt;
    }
    std::vector<std::string> names;
    names.reserve(value->size());
    for (const auto& entry : *value) {
        if (entry.is_string()) {
            names.push_back(entry.get<std::string>());
        }
    }
    return names;
}

auto isSchemaShaped(const json& value) -> bool {
    return value.is_object() || value.is_boolean();
}

auto decodeSubschema(const json& schema, const char* keyword) -> SchemaNodePtr {
    const json* value = findKeyword(schema, keyword);
    if (value == nullptr) {
        return nullptr;
    }
    if (!isSchemaShaped(*value)) {
        warnIgnored(keyword, *value);
        return nullptr;
    }
    return decodeSchema(*value);
}

auto decodeSchemaList(const json& schema, const char* keyword)
    -> std::optional<std::vector<SchemaNodePtr>> {
    const json* value = findKeyword(schema, keyword);
    if (value == nullptr) {
        return std::nullopt;
    }
    if (!value->is_array()) {
        warnIgnored(keyword, *value);
        return std::nullopt;
    }
    std::vector<SchemaNodePtr> nodes;
    nodes.reserve(value->size());
    for (const auto& entry : *value) {
        nodes.push_back(decodeSchema(entry));
    }
    return nodes;
}

auto decodeSchemaMap(const json& schema,
                     const char* keyword) -> std::optional<NamedSchemas> {
    const json* value = findKeyword(schema, keyword);
    if (value == nullptr) {
        return std::nullopt;
    }
    if (!value->is_object()) {
        warnIgnored(keyword, *value);
        return std::nullopt;
    }
    NamedSchemas named;
    named.reserve(value->size());
    for (const auto& [name, entry] : value->items()) {
        named.emplace_back(name, decodeSchema(entry));
    }
    return named;
}

auto decodeType(const json& schema)
    -> std::optional<std::vector<PrimitiveType>> {
    const json* value = findKeyword(schema, "type");
    if (value == nullptr) {
        return std::nullopt;
    }

    std::vector<PrimitiveType> types;
    if (value->is_string()) {
        // An unknown name leaves the set empty, which rejects every value.
        if (auto type = primitiveTypeFromString(value->get<std::string>())) {
            types.push_back(*type);
        }
        return types;
    }
    if (value->is_array()) {
        for (const auto& entry : *value) {
            if (!entry.is_string()) {
                continue;
            }
            if (auto type = primitiveTypeFromString(entry.get<std::string>())) {
                types.push_back(*type);
            }
        }
        return types;
    }

    warnIgnored("type", *value);
    return std::nullopt;
}

void decodeExclusiveBound(const json& schema, const char* keyword, bool& flag,
                          std::optional<double>& bound) {
    const json* value = findKeyword(schema, keyword);
    if (value == nullptr) {
        return;
    }
    if (value->is_boolean()) {
        flag = value->get<bool>();
    } else if (value->is_number()) {
        bound = value->get<double>();
    } else {
        warnIgnored(keyword, *value);
    }
}

void decodeItems(const json& schema, SchemaNode& node) {
    const json* value = findKeyword(schema, "items");
    if (value != nullptr) {
        if (value->is_array()) {
            node.tuple_items = decodeSchemaList(schema, "items");
        } else if (isSchemaShaped(*value)) {
            node.items = decodeSchema(*value);
        } else {
            warnIgnored("items", *value);
        }
    }
    node.additional_items = decodeSubschema(schema, "additionalItems");
}

void decodeDependencies(const json& schema, SchemaNode& node) {
    const json* value = findKeyword(schema, "dependencies");
    if (value == nullptr) {
        return;
    }
    if (!value->is_object()) {
        warnIgnored("dependencies", *value);
        return;
    }

    for (const auto& [key, dependency] : value->items()) {
        Dependency entry;
        entry.key = key;
        if (dependency.is_array()) {
            for (const auto& name : dependency) {
                if (name.is_string()) {
                    entry.required_keys.push_back(name.get<std::string>());
                }
            }
        } else if (isSchemaShaped(dependency)) {
            entry.schema = decodeSchema(dependency);
        } else {
            warnIgnored("dependencies", dependency);
            continue;
        }
        node.dependencies.push_back(std::move(entry));
    }
}

}  // namespace

auto decodeSchema(const json& schema) -> SchemaNodePtr {
    auto node = std::make_shared<SchemaNode>();

    if (schema.is_boolean()) {
        node->boolean = schema.get<bool>();
        return node;
    }
    if (!schema.is_object()) {
        return node;
    }

    node->title = decodeString(schema, "title");
    node->description = decodeString(schema, "description");

    node->ref = decodeString(schema, "$ref");
    node->type = decodeType(schema);

    node->all_of = decodeSchemaList(schema, "allOf");
    node->any_of = decodeSchemaList(schema, "anyOf");
    node->one_of = decodeSchemaList(schema, "oneOf");
    node->not_schema = decodeSubschema(schema, "not");

    if (const json* values = findKeyword(schema, "enum")) {
        if (values->is_array()) {
            node->enum_values = values->get<std::vector<json>>();
        } else {
            warnIgnored("enum", *values);
        }
    }

    node->max_length = decodeCount(schema, "maxLength");
    node->min_length = decodeCount(schema, "minLength");
    node->pattern = decodeString(schema, "pattern");

    node->multiple_of = decodeNumber(schema, "multipleOf");
    node->minimum = decodeNumber(schema, "minimum");
    node->maximum = decodeNumber(schema, "maximum");
    decodeExclusiveBound(schema, "exclusiveMinimum", node->exclusive_minimum,
                         node->exclusive_minimum_bound);
    decodeExclusiveBound(schema, "exclusiveMaximum", node->exclusive_maximum,
                         node->exclusive_maximum_bound);

    node->min_items = decodeCount(schema, "minItems");
    node->max_items = decodeCount(schema, "maxItems");
    if (const json* unique = findKeyword(schema, "uniqueItems")) {
        node->unique_items = unique->is_boolean() && unique->get<bool>();
    }
    decodeItems(schema, *node);

    node->max_properties = decodeCount(schema, "maxProperties");
    node->min_properties = decodeCount(schema, "minProperties");
    node->required = decodeStringList(schema, "required");
    node->properties = decodeSchemaMap(schema, "properties");
    node->pattern_properties = decodeSchemaMap(schema, "patternProperties");
    node->additional_properties =
        decodeSubschema(schema, "additionalProperties");

    decodeDependencies(schema, *node);

    node->format = decodeString(schema, "format");

    return node;
}

}  // namespace verity::schema
