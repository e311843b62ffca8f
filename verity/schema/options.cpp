/*
 * options.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-4-5

Description: Configuration options for schema validation

**************************************************/

#include "options.hpp"

#include <cstdint>

#include "verity/error/exception.hpp"
#include "verity/schema/node.hpp"

namespace verity::schema {

auto ValidationOptions::fromJson(const json& config) -> ValidationOptions {
    if (!config.is_object()) {
        THROW_INVALID_ARGUMENT("Validation options must be a JSON object, got {}",
                               config.type_name());
    }

    ValidationOptions options;
    if (auto it = config.find("max_reference_depth"); it != config.end()) {
        if (!it->is_number_integer() || it->get<std::int64_t>() < 0) {
            THROW_INVALID_ARGUMENT(
                "'max_reference_depth' must be a non-negative integer, got {}",
                describeValue(*it));
        }
        options.max_reference_depth =
            static_cast<std::size_t>(it->get<std::int64_t>());
    }

    options.validate();
    return options;
}

void ValidationOptions::validate() const {
    if (max_reference_depth == 0) {
        THROW_INVALID_ARGUMENT("'max_reference_depth' must be at least 1");
    }
}

auto ValidationOptions::toJson() const -> json {
    return {{"max_reference_depth", max_reference_depth}};
}

}  // namespace verity::schema
