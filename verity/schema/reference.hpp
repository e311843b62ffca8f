/*
 * reference.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-4-5

Description: Resolution of local "$ref" references

**************************************************/

#ifndef VERITY_SCHEMA_REFERENCE_HPP
#define VERITY_SCHEMA_REFERENCE_HPP

#include <cstddef>
#include <string>
#include <string_view>

#include "verity/schema/combinators.hpp"
#include "verity/schema/context.hpp"

namespace verity::schema {

/**
 * @brief Outcome of navigating a local reference: the target node, or an
 * error message when navigation failed.
 */
struct ReferenceTarget {
    const json* node{nullptr};
    std::string error;

    [[nodiscard]] auto found() const noexcept -> bool {
        return node != nullptr;
    }
};

/**
 * @brief Navigates a reference of the form "#" or "#/a/b/..." within a
 * document.
 *
 * The part after "#/" is percent-decoded, split on '/', and each segment
 * is unescaped ("~1" -> "/", "~0" -> "~"). Objects are entered by key and
 * arrays by in-range decimal index. Every other reference is reported as
 * an unsupported remote reference.
 */
[[nodiscard]] auto findReference(const json& document,
                                 std::string_view reference)
    -> ReferenceTarget;

/**
 * @brief Turns "$ref" strings into validators over the context's root
 * document.
 *
 * The target is located eagerly, so broken references fail with a fixed
 * message, but compiled only when the returned validator runs. Each hop
 * increases the depth; once it reaches the configured maximum the
 * reference fails instead of recursing, which bounds cyclic schemas.
 */
class ReferenceResolver {
public:
    ReferenceResolver(SchemaContextPtr context, std::size_t depth);

    [[nodiscard]] auto resolve(const std::string& reference) const
        -> Validator;

private:
    SchemaContextPtr context_;
    std::size_t depth_;
};

}  // namespace verity::schema

#endif  // VERITY_SCHEMA_REFERENCE_HPP
