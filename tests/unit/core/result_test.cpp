#include <gtest/gtest.h>

#include <daemux/core/types.h>

#include <memory>
#include <string>

using namespace daemux;

TEST(ResultTest, HoldsValue) {
    Result<int> r(42);
    ASSERT_TRUE(r);
    EXPECT_TRUE(r.has_value());
    EXPECT_EQ(r.value(), 42);
    EXPECT_THROW((void)r.error(), std::runtime_error);
}

TEST(ResultTest, HoldsErrorWithDefaultMessage) {
    Result<std::string> r(ErrorCode::NotFound);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::NotFound);
    EXPECT_EQ(r.error().message, "Not found");
    EXPECT_THROW((void)r.value(), std::runtime_error);
}

TEST(ResultTest, MoveOnlyValue) {
    Result<std::unique_ptr<int>> r(std::make_unique<int>(7));
    ASSERT_TRUE(r);
    auto p = std::move(r).value();
    ASSERT_NE(p, nullptr);
    EXPECT_EQ(*p, 7);
}

TEST(ResultTest, VoidSuccessAndFailure) {
    Result<void> ok;
    EXPECT_TRUE(ok);
    EXPECT_NO_THROW(ok.value());

    Result<void> bad(Error{ErrorCode::AddressInUse, "taken"});
    ASSERT_FALSE(bad);
    EXPECT_TRUE(bad.error() == ErrorCode::AddressInUse);
    EXPECT_EQ(bad.error().message, "taken");
    EXPECT_THROW(bad.value(), std::runtime_error);
}

TEST(ResultTest, ErrorCodeNames) {
    EXPECT_STREQ(errorToString(ErrorCode::ConnectionRefused), "Connection refused");
    EXPECT_STREQ(errorToString(ErrorCode::Timeout), "Operation timed out");
    EXPECT_STREQ(errorToString(ErrorCode::SpawnFailed), "Spawn failed");
}
