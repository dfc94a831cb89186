#include <gtest/gtest.h>

#include "core/status.hpp"

using namespace orderkv;

TEST(StatusTest, DefaultIsOk) {
    core::Status status;
    EXPECT_TRUE(status.ok());
    EXPECT_EQ(status.to_string(), "OK");
}

TEST(StatusTest, NotFoundHelper) {
    auto status = core::Status::NotFound("missing key");
    EXPECT_TRUE(status.is_not_found());
    EXPECT_EQ(status.to_string(), "NotFound: missing key");
}

TEST(StatusTest, NotSupportedHelper) {
    auto status = core::Status::NotSupported("no scans");
    EXPECT_FALSE(status.ok());
    EXPECT_TRUE(status.is_not_supported());
    EXPECT_EQ(status.code(), core::StatusCode::NotSupported);
    EXPECT_EQ(status.message(), "no scans");
    EXPECT_EQ(status.to_string(), "NotSupported: no scans");
}

TEST(StatusTest, InvalidArgumentToString) {
    auto status = core::Status::InvalidArgument("bad argument");
    EXPECT_FALSE(status.ok());
    EXPECT_EQ(status.to_string(), "InvalidArgument: bad argument");
}

TEST(StatusTest, EqualityComparesCodeAndMessage) {
    EXPECT_EQ(core::Status::Corruption("x"), core::Status::Corruption("x"));
    EXPECT_FALSE(core::Status::Corruption("x") == core::Status::Corruption("y"));
    EXPECT_FALSE(core::Status::Corruption("x") == core::Status::IOError("x"));
}
