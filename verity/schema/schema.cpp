/*
 * schema.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-4-5

Description: JSON Schema validation entry points

**************************************************/

#include "schema.hpp"

#include <memory>
#include <utility>

#include <spdlog/spdlog.h>

#include "verity/schema/compiler.hpp"

namespace verity::schema {

namespace {
auto validateWithContext(const json& value,
                         const SchemaContextPtr& context) -> ValidationResult {
    spdlog::debug("Validating against schema '{}'",
                  context->title().value_or("<untitled>"));

    SchemaCompiler compiler(context);
    auto result = compiler.compileAll(context->root())(value);

    if (!result.isValid()) {
        spdlog::debug("Validation failed with {} error(s)",
                      result.errors().size());
    }
    return result;
}
}  // namespace

Schema::Schema(json document, FormatRegistry formats, ValidationOptions options)
    : context_(std::make_shared<const SchemaContext>(
          std::move(document), std::move(formats), options)) {}

auto Schema::validate(const json& value) const -> ValidationResult {
    auto context = std::make_shared<const SchemaContext>(
        context_->document(), context_->formats(), context_->options());
    return validateWithContext(value, context);
}

auto validate(const json& value, const json& schemaDocument,
              const FormatRegistry& formats,
              const ValidationOptions& options) -> ValidationResult {
    auto context =
        std::make_shared<const SchemaContext>(schemaDocument, formats, options);
    return validateWithContext(value, context);
}

}  // namespace verity::schema
