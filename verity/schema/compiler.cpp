/*
 * compiler.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-4-5

Description: Compiles schema nodes into validators

**************************************************/

#include "compiler.hpp"

#include <format>
#include <optional>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

#include "verity/schema/keywords.hpp"
#include "verity/schema/reference.hpp"

namespace verity::schema {

namespace {
constexpr const char* FALSE_SCHEMA_MESSAGE =
    "Schema 'false' does not accept any value";

// How "additionalItems" / "additionalProperties" treat extra entries.
struct AdditionalPolicy {
    bool allowed{true};
    Validator validator;
};
}  // namespace

SchemaCompiler::SchemaCompiler(SchemaContextPtr context,
                               std::size_t referenceDepth)
    : context_(std::move(context)), reference_depth_(referenceDepth) {}

auto SchemaCompiler::compileAll(const SchemaNode& node) const -> Validator {
    return allOf(compile(node));
}

auto SchemaCompiler::childCompiler() const -> SchemaCompiler {
    return SchemaCompiler(context_);
}

auto SchemaCompiler::compileSubschemas(
    const std::vector<SchemaNodePtr>& nodes) const -> std::vector<Validator> {
    std::vector<Validator> validators;
    validators.reserve(nodes.size());
    for (const auto& node : nodes) {
        validators.push_back(compileAll(*node));
    }
    return validators;
}

auto SchemaCompiler::compile(const SchemaNode& node) const
    -> std::vector<Validator> {
    std::vector<Validator> validators;

    if (node.boolean) {
        if (!*node.boolean) {
            validators.push_back(invalid(FALSE_SCHEMA_MESSAGE));
        }
        return validators;
    }

    if (node.ref) {
        validators.push_back(
            ReferenceResolver(context_, reference_depth_).resolve(*node.ref));
    }

    if (node.type) {
        validators.push_back(validateType(*node.type));
    }

    compileCombinators(node, validators);

    if (node.enum_values) {
        validators.push_back(validateEnum(*node.enum_values));
    }

    compileString(node, validators);
    compileNumber(node, validators);
    compileArray(node, validators);
    compileObject(node, validators);
    compileFormat(node, validators);

    spdlog::trace("Compiled {} validators at reference depth {}",
                  validators.size(), reference_depth_);
    return validators;
}

void SchemaCompiler::compileCombinators(
    const SchemaNode& node, std::vector<Validator>& validators) const {
    if (node.all_of) {
        validators.push_back(allOf(compileSubschemas(*node.all_of)));
    }
    if (node.any_of) {
        validators.push_back(anyOf(compileSubschemas(*node.any_of)));
    }
    if (node.one_of) {
        validators.push_back(oneOf(compileSubschemas(*node.one_of)));
    }
    if (node.not_schema) {
        validators.push_back(notOf(compileAll(*node.not_schema)));
    }
}

void SchemaCompiler::compileString(const SchemaNode& node,
                                   std::vector<Validator>& validators) const {
    if (node.max_length) {
        validators.push_back(validateMaxLength(*node.max_length));
    }
    if (node.min_length) {
        validators.push_back(validateMinLength(*node.min_length));
    }
    if (node.pattern) {
        validators.push_back(validatePattern(*node.pattern));
    }
}

void SchemaCompiler::compileNumber(const SchemaNode& node,
                                   std::vector<Validator>& validators) const {
    if (node.multiple_of) {
        validators.push_back(validateMultipleOf(*node.multiple_of));
    }
    if (node.minimum) {
        validators.push_back(
            validateMinimum(*node.minimum, node.exclusive_minimum));
    }
    if (node.maximum) {
        validators.push_back(
            validateMaximum(*node.maximum, node.exclusive_maximum));
    }
    // Numeric exclusive bounds stand on their own (draft 6 form).
    if (node.exclusive_minimum_bound) {
        validators.push_back(
            validateMinimum(*node.exclusive_minimum_bound, true));
    }
    if (node.exclusive_maximum_bound) {
        validators.push_back(
            validateMaximum(*node.exclusive_maximum_bound, true));
    }
}

void SchemaCompiler::compileArray(const SchemaNode& node,
                                  std::vector<Validator>& validators) const {
    if (node.min_items) {
        validators.push_back(validateMinItems(*node.min_items));
    }
    if (node.max_items) {
        validators.push_back(validateMaxItems(*node.max_items));
    }
    if (node.unique_items) {
        validators.push_back(validateUniqueItems());
    }

    // Element schemas apply to other values, so their "$ref" hops start over.
    const auto child = childCompiler();
    if (node.items) {
        validators.push_back(validateItems(child.compileAll(*node.items)));
    } else if (node.tuple_items) {
        AdditionalPolicy additional{true, valid()};
        if (node.additional_items) {
            if (node.additional_items->boolean.value_or(true)) {
                additional.validator = child.compileAll(*node.additional_items);
            } else {
                additional.allowed = false;
            }
        }
        validators.push_back(validateTupleItems(
            child.compileSubschemas(*node.tuple_items), additional.allowed,
            std::move(additional.validator)));
    }
}

void SchemaCompiler::compileObject(const SchemaNode& node,
                                   std::vector<Validator>& validators) const {
    if (node.max_properties) {
        validators.push_back(validateMaxProperties(*node.max_properties));
    }
    if (node.min_properties) {
        validators.push_back(validateMinProperties(*node.min_properties));
    }
    if (node.required) {
        validators.push_back(validateRequired(*node.required));
    }

    if (node.hasPropertyKeywords()) {
        const auto child = childCompiler();
        auto compileNamed = [&child](const std::optional<NamedSchemas>& named) {
            std::vector<std::pair<std::string, Validator>> compiled;
            if (!named) {
                return compiled;
            }
            compiled.reserve(named->size());
            for (const auto& [name, schema] : *named) {
                compiled.emplace_back(name, child.compileAll(*schema));
            }
            return compiled;
        };

        AdditionalPolicy additional{true, valid()};
        if (node.additional_properties) {
            if (node.additional_properties->boolean.value_or(true)) {
                additional.validator =
                    child.compileAll(*node.additional_properties);
            } else {
                additional.allowed = false;
            }
        }

        validators.push_back(validateProperties(
            compileNamed(node.properties),
            compileNamed(node.pattern_properties), additional.allowed,
            std::move(additional.validator)));
    }

    for (const auto& dependency : node.dependencies) {
        if (dependency.schema) {
            validators.push_back(validateSchemaDependency(
                dependency.key, compileAll(*dependency.schema)));
        } else {
            validators.push_back(validatePropertyDependency(
                dependency.key, dependency.required_keys));
        }
    }
}

void SchemaCompiler::compileFormat(const SchemaNode& node,
                                   std::vector<Validator>& validators) const {
    if (!node.format) {
        return;
    }

    const auto& name = *node.format;
    if (const auto* format = context_->formats().find(name)) {
        validators.push_back(validateFormat(name, *format));
        return;
    }

    spdlog::warn("Unsupported format '{}' in schema", name);
    validators.push_back(invalid(
        std::format("'format' validation of '{}' is not supported", name)));
}

}  // namespace verity::schema
