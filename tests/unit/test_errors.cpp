#include <string>
#include <gtest/gtest.h>
#include "core/errors/client_errors.hpp"

using namespace mcplink::core::errors;

// A dummy function to simulate a launch that may fail
Result<std::string> simulate_launch(bool should_fail) {
    if (should_fail) {
        return ClientError{ErrorKind::Launch, "Executable not found", "launch_failed"};
    }
    return std::string("pid 42");
}

TEST(ErrorModelTest, HandlesSuccess) {
    auto result = simulate_launch(false);

    EXPECT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), "pid 42");
}

TEST(ErrorModelTest, HandlesFailure) {
    auto result = simulate_launch(true);

    EXPECT_TRUE(is_error(result));

    auto error = get_error(result);
    EXPECT_EQ(error.kind, ErrorKind::Launch);
    EXPECT_EQ(error.message, "Executable not found");
    EXPECT_EQ(error.code, "launch_failed");
    EXPECT_EQ(error.rpc_code, 0);
    EXPECT_TRUE(error.data.is_null());
}

TEST(ErrorModelTest, OnlyConnectTimeKindsAreRetryable) {
    EXPECT_TRUE(is_retryable(ClientError{ErrorKind::Launch, "x"}));
    EXPECT_TRUE(is_retryable(ClientError{ErrorKind::Connection, "x"}));
    EXPECT_FALSE(is_retryable(ClientError{ErrorKind::Protocol, "x"}));
    EXPECT_FALSE(is_retryable(ClientError{ErrorKind::Remote, "x"}));
    EXPECT_FALSE(is_retryable(ClientError{ErrorKind::Timeout, "x"}));
    EXPECT_FALSE(is_retryable(ClientError{ErrorKind::Input, "x"}));
    EXPECT_FALSE(is_retryable(ClientError{ErrorKind::Internal, "x"}));
}

TEST(ErrorModelTest, DescribeIncludesKindCodeAndRpcCode) {
    ClientError error{ErrorKind::Timeout, "Timeout waiting for response", "request_timeout", "",
                      rpc::kInternalError};
    EXPECT_EQ(describe(error),
              "timeout/request_timeout: Timeout waiting for response (rpc -32603)");

    ClientError plain{ErrorKind::Input, "Unknown server: x", "unknown_server"};
    EXPECT_EQ(describe(plain), "input/unknown_server: Unknown server: x");
}

TEST(ErrorModelTest, VoidResultOkHoldsNoError) {
    VoidResult result = ok();
    EXPECT_FALSE(is_error(result));
}
