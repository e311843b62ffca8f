/*
 * options.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-4-5

Description: Configuration options for schema validation

**************************************************/

#ifndef VERITY_SCHEMA_OPTIONS_HPP
#define VERITY_SCHEMA_OPTIONS_HPP

#include <cstddef>

#include <nlohmann/json.hpp>

namespace verity::schema {

using json = nlohmann::json;

/**
 * @brief Configuration options for JSON Schema validation
 */
struct ValidationOptions {
    // Number of "$ref" hops followed before resolution is abandoned; bounds
    // recursion for cyclic reference graphs.
    std::size_t max_reference_depth{32};

    /**
     * @brief Reads options from a JSON object such as
     * {"max_reference_depth": 16}. Missing keys keep their defaults and
     * unknown keys are ignored.
     * @throws error::InvalidArgument if config is not an object or a known
     * key holds a value of the wrong type
     */
    [[nodiscard]] static auto fromJson(const json& config)
        -> ValidationOptions;

    /**
     * @brief Checks option values.
     * @throws error::InvalidArgument if max_reference_depth is zero
     */
    void validate() const;

    [[nodiscard]] auto toJson() const -> json;
};

}  // namespace verity::schema

#endif  // VERITY_SCHEMA_OPTIONS_HPP
