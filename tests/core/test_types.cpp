#include <gtest/gtest.h>
#include "core/types.h"
#include <memory>

using namespace station;

TEST(StatusTest, DefaultIsOk) {
    Status status;
    EXPECT_TRUE(status.ok());
    EXPECT_EQ(status.code, ErrorCode::Ok);
    EXPECT_EQ(status.to_string(), "Ok");
}

TEST(StatusTest, ResizeIgnoredIsNotAFailure) {
    Status status(ErrorCode::ResizeIgnored, "session t-1 has ended");
    EXPECT_TRUE(status.ok());
}

TEST(StatusTest, ErrorsCarryNameAndMessage) {
    Status status(ErrorCode::UnknownSession, "unknown session t-9");
    EXPECT_FALSE(status.ok());
    EXPECT_EQ(status.to_string(), "UnknownSession: unknown session t-9");

    EXPECT_FALSE(Status(ErrorCode::SpawnError, "").ok());
    EXPECT_FALSE(Status(ErrorCode::IOError, "").ok());
    EXPECT_STREQ(error_code_name(ErrorCode::IOError), "IOError");
}

TEST(ResultTest, HoldsValue) {
    Result<SessionId> result(SessionId("t-abc-1"));
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.code(), ErrorCode::Ok);
    EXPECT_EQ(result.value(), "t-abc-1");
}

TEST(ResultTest, HoldsError) {
    Result<SessionId> result(Status(ErrorCode::SpawnError, "no such file"));
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.code(), ErrorCode::SpawnError);
    EXPECT_EQ(result.status().message, "no such file");
}

TEST(ResultTest, TakeMovesMoveOnlyValue) {
    Result<std::unique_ptr<int>> result(std::make_unique<int>(7));
    ASSERT_TRUE(result.ok());
    std::unique_ptr<int> value = result.take();
    ASSERT_NE(value, nullptr);
    EXPECT_EQ(*value, 7);
}
