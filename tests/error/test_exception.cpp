#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>
#include <thread>

#include "verity/error/exception.hpp"

using namespace verity::error;
using ::testing::HasSubstr;

namespace {

void throwInvalidArgument(const std::string& name) {
    THROW_INVALID_ARGUMENT("Format '{}' is not registered", name);
}

}  // namespace

TEST(ExceptionTest, FormatsMessageArguments) {
    try {
        throwInvalidArgument("ipv4");
        FAIL() << "Expected InvalidArgument";
    } catch (const InvalidArgument& e) {
        EXPECT_EQ(e.getMessage(), "Format 'ipv4' is not registered");
        EXPECT_EQ(e.getFunction(), "throwInvalidArgument");
        EXPECT_GT(e.getLine(), 0);
        EXPECT_THAT(e.getFile(), HasSubstr("test_exception.cpp"));
    }
}

TEST(ExceptionTest, MessageWithoutArgumentsIsKeptVerbatim) {
    try {
        THROW_INVALID_ARGUMENT("braces {} stay as written");
    } catch (const InvalidArgument& e) {
        EXPECT_EQ(e.getMessage(), "braces {} stay as written");
    }
}

TEST(ExceptionTest, WhatIncludesThrowSite) {
    try {
        THROW_INVALID_ARGUMENT("bad value {}", 42);
    } catch (const Exception& e) {
        const std::string what = e.what();
        EXPECT_THAT(what, HasSubstr("Message: bad value 42"));
        EXPECT_THAT(what, HasSubstr("test_exception.cpp"));
        EXPECT_EQ(e.getThreadId(), std::this_thread::get_id());
    }
}

TEST(ExceptionTest, DerivesFromStdException) {
    EXPECT_THROW(THROW_INVALID_ARGUMENT("oops"), std::exception);
}
