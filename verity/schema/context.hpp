/*
 * context.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-4-5

Description: Immutable state shared by the validators of one validation

**************************************************/

#ifndef VERITY_SCHEMA_CONTEXT_HPP
#define VERITY_SCHEMA_CONTEXT_HPP

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "verity/schema/format.hpp"
#include "verity/schema/node.hpp"
#include "verity/schema/options.hpp"

namespace verity::schema {

/**
 * @brief Root schema document together with the registry and options used
 * to compile it.
 *
 * Built once per validation and never mutated; compiled validators hold it
 * through a shared pointer so that lazily resolved references can still
 * reach the root document.
 */
class SchemaContext {
public:
    /**
     * @throws error::InvalidArgument if options are invalid
     */
    SchemaContext(json document, FormatRegistry formats,
                  ValidationOptions options);

    [[nodiscard]] auto document() const noexcept -> const json& {
        return document_;
    }

    [[nodiscard]] auto root() const noexcept -> const SchemaNode& {
        return *root_;
    }

    [[nodiscard]] auto title() const -> const std::optional<std::string>& {
        return root_->title;
    }

    [[nodiscard]] auto description() const
        -> const std::optional<std::string>& {
        return root_->description;
    }

    /**
     * @brief Type tags of the root schema; empty when "type" is absent or
     * names no known type.
     */
    [[nodiscard]] auto types() const -> std::vector<PrimitiveType>;

    [[nodiscard]] auto formats() const noexcept -> const FormatRegistry& {
        return formats_;
    }

    [[nodiscard]] auto options() const noexcept -> const ValidationOptions& {
        return options_;
    }

private:
    json document_;
    SchemaNodePtr root_;
    FormatRegistry formats_;
    ValidationOptions options_;
};

using SchemaContextPtr = std::shared_ptr<const SchemaContext>;

}  // namespace verity::schema

#endif  // VERITY_SCHEMA_CONTEXT_HPP
