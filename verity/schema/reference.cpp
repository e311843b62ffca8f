/*
 * reference.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-4-5

Description: Resolution of local "$ref" references

**************************************************/

#include "reference.hpp"

#include <charconv>
#include <format>
#include <optional>
#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>

#include "verity/schema/compiler.hpp"
#include "verity/utils/string.hpp"

namespace verity::schema {

namespace {
auto remoteReference(std::string_view reference) -> ReferenceTarget {
    return {nullptr,
            std::format("Remote $ref '{}' is not supported", reference)};
}

auto unescapeSegment(std::string_view segment) -> std::string {
    return utils::replaceString(utils::replaceString(segment, "~1", "/"), "~0",
                                "~");
}

auto parseIndex(std::string_view segment) -> std::optional<std::size_t> {
    if (segment.empty()) {
        return std::nullopt;
    }
    std::size_t index = 0;
    const auto* end = segment.data() + segment.size();
    auto [ptr, ec] = std::from_chars(segment.data(), end, index);
    if (ec != std::errc() || ptr != end) {
        return std::nullopt;
    }
    return index;
}
}  // namespace

auto findReference(const json& document,
                   std::string_view reference) -> ReferenceTarget {
    if (reference == "#") {
        return {&document, {}};
    }
    if (!utils::startsWith(reference, "#/")) {
        return remoteReference(reference);
    }

    std::string path;
    try {
        path = utils::urlDecode(reference.substr(2));
    } catch (const std::invalid_argument& e) {
        spdlog::debug("Cannot decode reference '{}': {}", reference, e.what());
        return remoteReference(reference);
    }

    const json* current = &document;
    for (const auto& rawSegment : utils::splitString(path, '/')) {
        const std::string segment = unescapeSegment(rawSegment);

        if (current->is_object()) {
            auto it = current->find(segment);
            if (it != current->end()) {
                current = &*it;
                continue;
            }
        } else if (current->is_array()) {
            if (auto index = parseIndex(segment);
                index && *index < current->size()) {
                current = &(*current)[*index];
                continue;
            }
        }

        return {nullptr, std::format("Reference not found '{}' in '{}'",
                                     segment, reference)};
    }
    return {current, {}};
}

ReferenceResolver::ReferenceResolver(SchemaContextPtr context,
                                     std::size_t depth)
    : context_(std::move(context)), depth_(depth) {}

auto ReferenceResolver::resolve(const std::string& reference) const
    -> Validator {
    const auto maxDepth = context_->options().max_reference_depth;
    if (depth_ >= maxDepth) {
        spdlog::warn("Maximum reference depth {} exceeded while resolving '{}'",
                     maxDepth, reference);
        return invalid(std::format(
            "Maximum reference depth exceeded while resolving '{}'",
            reference));
    }

    auto target = findReference(context_->document(), reference);
    if (!target.found()) {
        spdlog::warn("Failed to resolve reference: {}", target.error);
        return invalid(std::move(target.error));
    }

    spdlog::debug("Resolved reference '{}' at depth {}", reference, depth_);
    auto node = decodeSchema(*target.node);
    return [context = context_, node = std::move(node),
            depth = depth_ + 1](const json& value) {
        return SchemaCompiler(context, depth).compileAll(*node)(value);
    };
}

}  // namespace verity::schema
