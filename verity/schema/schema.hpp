/*
 * schema.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-4-5

Description: JSON Schema validation entry points

**************************************************/

#ifndef VERITY_SCHEMA_SCHEMA_HPP
#define VERITY_SCHEMA_SCHEMA_HPP

#include <optional>
#include <string>
#include <vector>

#include "verity/schema/combinators.hpp"
#include "verity/schema/context.hpp"
#include "verity/schema/format.hpp"
#include "verity/schema/node.hpp"
#include "verity/schema/options.hpp"
#include "verity/schema/result.hpp"

namespace verity::schema {

/**
 * @brief A JSON Schema document that can validate values.
 *
 * Every call to validate() builds a fresh context and recompiles the
 * document, so a Schema holds no state beyond its inputs and may be used
 * from several threads at once.
 *
 * @code
 * Schema schema(json{{"type", "integer"}, {"minimum", 0}});
 * auto result = schema.validate(json(-1));
 * // result.errors() == {"Value is lower than minimum value of 0"}
 * @endcode
 */
class Schema {
public:
    /**
     * @param document The root schema document
     * @param formats Validators for the "format" keyword
     * @param options Validation options
     * @throws error::InvalidArgument if options are invalid
     */
    explicit Schema(json document,
                    FormatRegistry formats = FormatRegistry::withDefaults(),
                    ValidationOptions options = {});

    /**
     * @brief Validates a value against the schema.
     * @return Valid, or Invalid with every violation found
     */
    [[nodiscard]] auto validate(const json& value) const -> ValidationResult;

    [[nodiscard]] auto title() const -> const std::optional<std::string>& {
        return context_->title();
    }

    [[nodiscard]] auto description() const
        -> const std::optional<std::string>& {
        return context_->description();
    }

    [[nodiscard]] auto types() const -> std::vector<PrimitiveType> {
        return context_->types();
    }

    [[nodiscard]] auto document() const noexcept -> const json& {
        return context_->document();
    }

    [[nodiscard]] auto formats() const noexcept -> const FormatRegistry& {
        return context_->formats();
    }

    [[nodiscard]] auto options() const noexcept -> const ValidationOptions& {
        return context_->options();
    }

private:
    SchemaContextPtr context_;
};

/**
 * @brief Validates value against schemaDocument in one call.
 */
[[nodiscard]] auto validate(
    const json& value, const json& schemaDocument,
    const FormatRegistry& formats = FormatRegistry::withDefaults(),
    const ValidationOptions& options = {}) -> ValidationResult;

}  // namespace verity::schema

#endif  // VERITY_SCHEMA_SCHEMA_HPP
