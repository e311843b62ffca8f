#include <gtest/gtest.h>

#include "verity/error/exception.hpp"
#include "verity/schema/options.hpp"

using namespace verity::schema;
using verity::error::InvalidArgument;

TEST(ValidationOptionsTest, Defaults) {
    ValidationOptions options;
    EXPECT_EQ(options.max_reference_depth, 32u);
    EXPECT_NO_THROW(options.validate());
}

TEST(ValidationOptionsTest, FromJson) {
    auto options = ValidationOptions::fromJson(json{{"max_reference_depth", 4}});
    EXPECT_EQ(options.max_reference_depth, 4u);
}

TEST(ValidationOptionsTest, FromJsonKeepsDefaultsForMissingKeys) {
    auto options = ValidationOptions::fromJson(json::object());
    EXPECT_EQ(options.max_reference_depth, 32u);
}

TEST(ValidationOptionsTest, FromJsonIgnoresUnknownKeys) {
    auto options = ValidationOptions::fromJson(json{{"verbose", true}});
    EXPECT_EQ(options.max_reference_depth, 32u);
}

TEST(ValidationOptionsTest, FromJsonRejectsBadValues) {
    EXPECT_THROW((void)ValidationOptions::fromJson(json::array()),
                 InvalidArgument);
    EXPECT_THROW(
        (void)ValidationOptions::fromJson(json{{"max_reference_depth", -1}}),
        InvalidArgument);
    EXPECT_THROW(
        (void)ValidationOptions::fromJson(json{{"max_reference_depth", "8"}}),
        InvalidArgument);
    EXPECT_THROW(
        (void)ValidationOptions::fromJson(json{{"max_reference_depth", 2.5}}),
        InvalidArgument);
    EXPECT_THROW(
        (void)ValidationOptions::fromJson(json{{"max_reference_depth", 0}}),
        InvalidArgument);
}

TEST(ValidationOptionsTest, ValidateRejectsZeroDepth) {
    ValidationOptions options;
    options.max_reference_depth = 0;
    EXPECT_THROW(options.validate(), InvalidArgument);
}

TEST(ValidationOptionsTest, ToJson) {
    ValidationOptions options;
    options.max_reference_depth = 7;
    EXPECT_EQ(options.toJson(), json({{"max_reference_depth", 7}}));
    EXPECT_EQ(ValidationOptions::fromJson(options.toJson()).max_reference_depth,
              7u);
}
