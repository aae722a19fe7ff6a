#include <gtest/gtest.h>

#include "fwr/fwr.hpp"

TEST(VersionTest, MajorMinorPatch) {
    EXPECT_EQ(fwr::Version::major, 0);
    EXPECT_EQ(fwr::Version::minor, 3);
    EXPECT_EQ(fwr::Version::patch, 0);
}

TEST(VersionTest, VersionString) {
    EXPECT_STREQ(fwr::Version::string, "0.3.0");
}

TEST(ResultTest, OkValue) {
    auto result = fwr::Result<int>::ok(42);
    EXPECT_TRUE(result.hasValue());
    EXPECT_FALSE(result.hasError());
    EXPECT_EQ(result.value(), 42);
}

TEST(ResultTest, ErrorValue) {
    auto result = fwr::Result<int>::err(fwr::Error("something failed"));
    EXPECT_FALSE(result.hasValue());
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().message, "something failed");
    EXPECT_EQ(result.error().code, -1);
}

TEST(ResultTest, ErrorWithCode) {
    auto result = fwr::Result<int>::err(fwr::Error(404, "not found"));
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code, 404);
    EXPECT_EQ(result.error().message, "not found");
}

TEST(ResultTest, ValueOr) {
    auto ok = fwr::Result<int>::ok(10);
    auto err = fwr::Result<int>::err(fwr::Error("fail"));
    EXPECT_EQ(ok.valueOr(0), 10);
    EXPECT_EQ(err.valueOr(0), 0);
}

TEST(ResultTest, BoolConversion) {
    auto ok = fwr::Result<int>::ok(1);
    auto err = fwr::Result<int>::err(fwr::Error("fail"));
    EXPECT_TRUE(static_cast<bool>(ok));
    EXPECT_FALSE(static_cast<bool>(err));
}

TEST(ResultTest, MoveOutValue) {
    auto result = fwr::Result<std::string>::ok("payload");
    std::string taken = std::move(result).value();
    EXPECT_EQ(taken, "payload");
}

TEST(ResultVoidTest, Ok) {
    auto result = fwr::Result<void>::ok();
    EXPECT_TRUE(result.hasValue());
    EXPECT_FALSE(result.hasError());
}

TEST(ResultVoidTest, Error) {
    auto result = fwr::Result<void>::err(fwr::Error("void error"));
    EXPECT_FALSE(result.hasValue());
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().message, "void error");
}
