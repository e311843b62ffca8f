#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <vector>

#include "verity/error/exception.hpp"
#include "verity/schema/result.hpp"

using namespace verity::schema;
using ::testing::ElementsAre;

TEST(ValidationResultTest, ValidHasNoErrors) {
    auto result = ValidationResult::valid();
    EXPECT_TRUE(result.isValid());
    EXPECT_TRUE(static_cast<bool>(result));
    EXPECT_TRUE(result.errors().empty());
}

TEST(ValidationResultTest, InvalidCarriesMessage) {
    auto result = ValidationResult::invalid("Value exceeds maximum value of 3");
    EXPECT_FALSE(result.isValid());
    EXPECT_FALSE(static_cast<bool>(result));
    EXPECT_THAT(result.errors(), ElementsAre("Value exceeds maximum value of 3"));
}

TEST(ValidationResultTest, FromErrorsRequiresMessages) {
    EXPECT_THROW((void)ValidationResult::fromErrors({}),
                 verity::error::InvalidArgument);

    auto result = ValidationResult::fromErrors({"a", "b"});
    EXPECT_THAT(result.errors(), ElementsAre("a", "b"));
}

TEST(ValidationResultTest, FlattenOfNothingIsValid) {
    std::vector<ValidationResult> results;
    EXPECT_TRUE(flatten(results).isValid());
}

TEST(ValidationResultTest, FlattenOfValidResultsIsValid) {
    std::vector<ValidationResult> results{ValidationResult::valid(),
                                          ValidationResult::valid()};
    EXPECT_EQ(flatten(results), ValidationResult::valid());
}

TEST(ValidationResultTest, FlattenConcatenatesInOrder) {
    std::vector<ValidationResult> results{
        ValidationResult::invalid("first"), ValidationResult::valid(),
        ValidationResult::fromErrors({"second", "third"})};
    EXPECT_THAT(flatten(results).errors(),
                ElementsAre("first", "second", "third"));
}

TEST(ValidationResultTest, FlattenKeepsDuplicates) {
    std::vector<ValidationResult> results{ValidationResult::invalid("same"),
                                          ValidationResult::invalid("same")};
    EXPECT_THAT(flatten(results).errors(), ElementsAre("same", "same"));
}

TEST(ValidationResultTest, ToJson) {
    EXPECT_EQ(ValidationResult::valid().toJson(),
              json({{"valid", true}, {"errors", json::array()}}));
    EXPECT_EQ(ValidationResult::invalid("oops").toJson(),
              json({{"valid", false}, {"errors", json::array({"oops"})}}));
}
