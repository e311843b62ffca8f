#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "verity/schema/compiler.hpp"

using namespace verity::schema;
using ::testing::ElementsAre;
using ::testing::IsEmpty;
using ::testing::SizeIs;

class SchemaCompilerTest : public ::testing::Test {
protected:
    auto check(const json& schema, const json& value)
        -> std::vector<std::string> {
        auto context = std::make_shared<const SchemaContext>(
            schema, formats, ValidationOptions{});
        return SchemaCompiler(context).compileAll(context->root())(value)
            .errors();
    }

    FormatRegistry formats = FormatRegistry::withDefaults();
};

TEST_F(SchemaCompilerTest, BooleanSchemas) {
    EXPECT_THAT(check(json(true), json{{"anything", 1}}), IsEmpty());
    EXPECT_THAT(check(json(false), json(nullptr)),
                ElementsAre("Schema 'false' does not accept any value"));
}

TEST_F(SchemaCompilerTest, EmptySchemaAcceptsEverything) {
    auto context = std::make_shared<const SchemaContext>(
        json::object(), formats, ValidationOptions{});
    EXPECT_THAT(SchemaCompiler(context).compile(context->root()), IsEmpty());
    EXPECT_THAT(check(json::object(), json::array({1, "a"})), IsEmpty());
}

TEST_F(SchemaCompilerTest, OneValidatorPerKeyword) {
    auto context = std::make_shared<const SchemaContext>(
        json{{"type", "string"}, {"minLength", 1}, {"maxLength", 4},
             {"title", "ignored"}},
        formats, ValidationOptions{});
    EXPECT_THAT(SchemaCompiler(context).compile(context->root()), SizeIs(3));
}

TEST_F(SchemaCompilerTest, ErrorsFollowKeywordOrder) {
    json schema = {{"maxLength", 2}, {"type", "integer"}, {"pattern", "^[0-9]+$"}};
    EXPECT_THAT(check(schema, json("abc")),
                ElementsAre("'\"abc\"' is not of type 'integer'",
                            "Length of string is larger than max length 2",
                            "'abc' does not match pattern: '^[0-9]+$'"));
}

TEST_F(SchemaCompilerTest, UnknownTypeRejectsEverything) {
    EXPECT_THAT(check(json{{"type", "any"}}, json(1)),
                ElementsAre("'1' is not of any recognised type"));
}

TEST_F(SchemaCompilerTest, LegacyExclusiveBounds) {
    json schema = {{"minimum", 0},
                   {"exclusiveMinimum", true},
                   {"maximum", 10},
                   {"exclusiveMaximum", true}};
    EXPECT_THAT(check(schema, json(5)), IsEmpty());
    EXPECT_THAT(check(schema, json(0)),
                ElementsAre("Value is lower than or equal to exclusive minimum "
                            "value of 0"));
    EXPECT_THAT(
        check(schema, json(10)),
        ElementsAre("Value exceeds or equals exclusive maximum value of 10"));
}

TEST_F(SchemaCompilerTest, NumericExclusiveBounds) {
    json schema = {{"exclusiveMinimum", 1}, {"exclusiveMaximum", 3}};
    EXPECT_THAT(check(schema, json(2)), IsEmpty());
    EXPECT_THAT(check(schema, json(1)), SizeIs(1));
    EXPECT_THAT(check(schema, json(3)), SizeIs(1));
}

TEST_F(SchemaCompilerTest, Combinators) {
    json schema = {
        {"allOf", {{{"type", "number"}}, {{"minimum", 2}}}},
        {"not", {{"multipleOf", 7}}}};
    EXPECT_THAT(check(schema, json(3)), IsEmpty());
    EXPECT_THAT(check(schema, json(14)),
                ElementsAre("Value must not match the schema in 'not'"));
    EXPECT_THAT(check(schema, json("x")),
                ElementsAre("'\"x\"' is not of type 'number'",
                            "Value must not match the schema in 'not'"));
}

TEST_F(SchemaCompilerTest, AnyOfReportsBranchErrors) {
    json schema = {{"anyOf", {{{"type", "string"}}, {{"type", "null"}}}}};
    EXPECT_THAT(check(schema, json(nullptr)), IsEmpty());
    EXPECT_THAT(check(schema, json(1)),
                ElementsAre("'1' is not of type 'string'",
                            "'1' is not of type 'null'"));
    EXPECT_THAT(check(json{{"anyOf", json::array()}}, json(1)),
                ElementsAre("Value does not match any schema in 'anyOf'"));
}

TEST_F(SchemaCompilerTest, BooleanSubschemas) {
    json schema = {{"anyOf", {false, true}}};
    EXPECT_THAT(check(schema, json(1)), IsEmpty());
    EXPECT_THAT(check(json{{"not", true}}, json(1)),
                ElementsAre("Value must not match the schema in 'not'"));
}

TEST_F(SchemaCompilerTest, ItemsSchema) {
    json schema = {{"type", "array"},
                   {"items", {{"type", "integer"}}},
                   {"minItems", 1},
                   {"uniqueItems", true}};
    EXPECT_THAT(check(schema, json::array({1, 2})), IsEmpty());
    EXPECT_THAT(check(schema, json::array()),
                ElementsAre("Length of array is smaller than the minimum 1"));
    EXPECT_THAT(check(schema, json::array({1, 1})),
                ElementsAre("[1,1] does not have unique items"));
}

TEST_F(SchemaCompilerTest, TupleItemsWithAdditionalItems) {
    json tuple = json::array({json{{"type", "string"}}, json{{"type", "integer"}}});

    EXPECT_THAT(check(json{{"items", tuple}}, json::array({"a", 1, nullptr})),
                IsEmpty());
    EXPECT_THAT(
        check(json{{"items", tuple}, {"additionalItems", false}},
              json::array({"a", 1, 2})),
        ElementsAre("Additional items are not permitted in this array"));
    EXPECT_THAT(check(json{{"items", tuple},
                           {"additionalItems", {{"type", "boolean"}}}},
                      json::array({"a", 1, 2})),
                ElementsAre("'2' is not of type 'boolean'"));
    EXPECT_THAT(check(json{{"items", tuple}, {"additionalItems", true}},
                      json::array({"a", 1, 2})),
                IsEmpty());
}

TEST_F(SchemaCompilerTest, AdditionalItemsWithoutTupleIsIgnored) {
    json schema = {{"items", {{"type", "integer"}}}, {"additionalItems", false}};
    EXPECT_THAT(check(schema, json::array({1, 2, 3})), IsEmpty());
}

TEST_F(SchemaCompilerTest, ObjectProperties) {
    json schema = {
        {"type", "object"},
        {"properties", {{"name", {{"type", "string"}}}}},
        {"patternProperties", {{"^n_", {{"type", "number"}}}}},
        {"additionalProperties", false},
        {"required", {"name"}}};

    EXPECT_THAT(check(schema, json{{"name", "a"}, {"n_count", 2}}), IsEmpty());
    EXPECT_THAT(check(schema, json{{"n_count", "x"}}),
                ElementsAre("Required property 'name' is missing",
                            "'\"x\"' is not of type 'number'"));
    EXPECT_THAT(
        check(schema, json{{"name", "a"}, {"other", 1}}),
        ElementsAre("Additional property 'other' is not permitted in this object"));
}

TEST_F(SchemaCompilerTest, AdditionalPropertiesSchemaAlone) {
    json schema = {{"additionalProperties", {{"type", "string"}}}};
    EXPECT_THAT(check(schema, json{{"a", "x"}}), IsEmpty());
    EXPECT_THAT(check(schema, json{{"a", 1}}),
                ElementsAre("'1' is not of type 'string'"));
}

TEST_F(SchemaCompilerTest, PropertyCounts) {
    json schema = {{"minProperties", 1}, {"maxProperties", 2}};
    EXPECT_THAT(check(schema, json{{"a", 1}}), IsEmpty());
    EXPECT_THAT(check(schema, json::object()), SizeIs(1));
    EXPECT_THAT(check(schema, json{{"a", 1}, {"b", 2}, {"c", 3}}), SizeIs(1));
}

TEST_F(SchemaCompilerTest, Dependencies) {
    json schema = {
        {"dependencies",
         {{"card", {"billing"}},
          {"name", {{"properties", {{"age", {{"type", "integer"}}}}}}}}}};

    EXPECT_THAT(check(schema, json{{"card", 1}, {"billing", 2}}), IsEmpty());
    EXPECT_THAT(check(schema, json{{"card", 1}}),
                ElementsAre("'card' is missing its dependency of 'billing'"));
    EXPECT_THAT(check(schema, json{{"name", "x"}, {"age", "old"}}),
                ElementsAre("'\"old\"' is not of type 'integer'"));
    EXPECT_THAT(check(schema, json{{"age", "old"}}), IsEmpty());
}

TEST_F(SchemaCompilerTest, EnumAndFormat) {
    json schema = {{"enum", {"10.0.0.1", "::1"}}, {"format", "ipv4"}};
    EXPECT_THAT(check(schema, json("10.0.0.1")), IsEmpty());
    EXPECT_THAT(check(schema, json("::1")),
                ElementsAre("'::1' is not a valid 'ipv4' value"));
}

TEST_F(SchemaCompilerTest, UnsupportedFormat) {
    EXPECT_THAT(check(json{{"format", "email"}}, json("a@b.c")),
                ElementsAre("'format' validation of 'email' is not supported"));
}

TEST_F(SchemaCompilerTest, InjectedFormat) {
    formats.registerFormat("email", [](std::string_view text) {
        return text.find('@') != std::string_view::npos;
    });
    EXPECT_THAT(check(json{{"format", "email"}}, json("a@b.c")), IsEmpty());
    EXPECT_THAT(check(json{{"format", "email"}}, json("abc")),
                ElementsAre("'abc' is not a valid 'email' value"));
}

TEST_F(SchemaCompilerTest, ReferencesResolveAgainstRoot) {
    json schema = {
        {"definitions", {{"name", {{"type", "string"}, {"minLength", 1}}}}},
        {"properties", {{"first", {{"$ref", "#/definitions/name"}}}}}};
    EXPECT_THAT(check(schema, json{{"first", "Ada"}}), IsEmpty());
    EXPECT_THAT(
        check(schema, json{{"first", ""}}),
        ElementsAre("Length of string is smaller than minimum length 1"));
}

TEST_F(SchemaCompilerTest, ReferenceSiblingsStillApply) {
    json schema = {{"definitions", {{"int", {{"type", "integer"}}}}},
                   {"$ref", "#/definitions/int"},
                   {"minimum", 3}};
    EXPECT_THAT(check(schema, json(1)),
                ElementsAre("Value is lower than minimum value of 3"));
    EXPECT_THAT(check(schema, json(1.5)),
                ElementsAre("'1.5' is not of type 'integer'",
                            "Value is lower than minimum value of 3"));
}

TEST_F(SchemaCompilerTest, RecursiveSchemaValidatesNestedData) {
    json schema = {
        {"type", "object"},
        {"properties",
         {{"value", {{"type", "integer"}}},
          {"children", {{"type", "array"}, {"items", {{"$ref", "#"}}}}}}},
        {"required", {"value"}}};

    json tree = {{"value", 1},
                 {"children",
                  json::array({json{{"value", 2}, {"children", json::array()}},
                               json{{"value", 3}}})}};
    EXPECT_THAT(check(schema, tree), IsEmpty());

    tree["children"][1]["value"] = "three";
    EXPECT_THAT(check(schema, tree),
                ElementsAre("'\"three\"' is not of type 'integer'"));
}

TEST_F(SchemaCompilerTest, RecursionDepthFollowsDataNotReferenceCount) {
    json schema = {{"type", "object"},
                   {"properties", {{"child", {{"$ref", "#"}}}}}};

    json tree = json::object();
    for (int level = 0; level < 40; ++level) {
        tree = json{{"child", tree}};
    }
    EXPECT_THAT(check(schema, tree), IsEmpty());

    json broken = 1;
    for (int level = 0; level < 40; ++level) {
        broken = json{{"child", broken}};
    }
    EXPECT_THAT(check(schema, broken),
                ElementsAre("'1' is not of type 'object'"));
}

TEST_F(SchemaCompilerTest, RecursionThroughArraysIsNotBounded) {
    json schema = {{"type", "array"}, {"items", {{"$ref", "#"}}}};

    json nested = json::array();
    for (int level = 0; level < 40; ++level) {
        nested = json::array({nested});
    }
    EXPECT_THAT(check(schema, nested), IsEmpty());
}

TEST_F(SchemaCompilerTest, MutualReferencesAreBounded) {
    json schema = {{"definitions",
                    {{"a", {{"$ref", "#/definitions/b"}}},
                     {"b", {{"$ref", "#/definitions/a"}}}}},
                   {"$ref", "#/definitions/a"}};
    auto errors = check(schema, json(1));
    ASSERT_THAT(errors, SizeIs(1));
    EXPECT_THAT(errors[0],
                ::testing::HasSubstr("Maximum reference depth exceeded"));
}

TEST_F(SchemaCompilerTest, UnresolvedReference) {
    EXPECT_THAT(check(json{{"$ref", "#/missing"}}, json(1)),
                ElementsAre("Reference not found 'missing' in '#/missing'"));
    EXPECT_THAT(check(json{{"$ref", "http://x/y.json"}}, json(1)),
                ElementsAre("Remote $ref 'http://x/y.json' is not supported"));
}
