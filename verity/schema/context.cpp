/*
 * context.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-4-5

Description: Immutable state shared by the validators of one validation

**************************************************/

#include "context.hpp"

#include <utility>

namespace verity::schema {

SchemaContext::SchemaContext(json document, FormatRegistry formats,
                             ValidationOptions options)
    : document_(std::move(document)),
      formats_(std::move(formats)),
      options_(options) {
    options_.validate();
    root_ = decodeSchema(document_);
}

auto SchemaContext::types() const -> std::vector<PrimitiveType> {
    return root_->type.value_or(std::vector<PrimitiveType>{});
}

}  // namespace verity::schema
