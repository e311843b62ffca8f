/*
 * compiler.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-4-5

Description: Compiles schema nodes into validators

**************************************************/

#ifndef VERITY_SCHEMA_COMPILER_HPP
#define VERITY_SCHEMA_COMPILER_HPP

#include <cstddef>
#include <vector>

#include "verity/schema/combinators.hpp"
#include "verity/schema/context.hpp"
#include "verity/schema/node.hpp"

namespace verity::schema {

/**
 * @brief Turns a decoded schema node into validators.
 *
 * Nested schemas are compiled recursively against the same context, so a
 * "$ref" anywhere in the tree resolves against the root document. Nothing
 * is cached between compilations.
 */
class SchemaCompiler {
public:
    /**
     * @param context Root document, formats and options
     * @param referenceDepth Number of "$ref" hops already followed on the
     * value the compiled nodes apply to. Schemas for array elements and
     * object members are compiled at depth 0.
     */
    explicit SchemaCompiler(SchemaContextPtr context,
                            std::size_t referenceDepth = 0);

    /**
     * @brief Compiles one validator per keyword present in node.
     *
     * Keywords are visited in a fixed order, which only affects the order
     * of reported messages.
     */
    [[nodiscard]] auto compile(const SchemaNode& node) const
        -> std::vector<Validator>;

    /**
     * @brief The conjunction of compile(node).
     */
    [[nodiscard]] auto compileAll(const SchemaNode& node) const -> Validator;

private:
    [[nodiscard]] auto childCompiler() const -> SchemaCompiler;

    [[nodiscard]] auto compileSubschemas(
        const std::vector<SchemaNodePtr>& nodes) const -> std::vector<Validator>;

    void compileCombinators(const SchemaNode& node,
                            std::vector<Validator>& validators) const;
    void compileString(const SchemaNode& node,
                       std::vector<Validator>& validators) const;
    void compileNumber(const SchemaNode& node,
                       std::vector<Validator>& validators) const;
    void compileArray(const SchemaNode& node,
                      std::vector<Validator>& validators) const;
    void compileObject(const SchemaNode& node,
                       std::vector<Validator>& validators) const;
    void compileFormat(const SchemaNode& node,
                       std::vector<Validator>& validators) const;

    SchemaContextPtr context_;
    std::size_t reference_depth_;
};

}  // namespace verity::schema

#endif  // VERITY_SCHEMA_COMPILER_HPP
