#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/errors/client_errors.hpp"
#include "protocol/capabilities.hpp"
#include "protocol/progress.hpp"

namespace {

using mcplink::core::errors::ErrorKind;
using mcplink::core::errors::get_error;
using mcplink::core::errors::get_value;
using mcplink::core::errors::is_error;
using mcplink::protocol::Capabilities;
using mcplink::protocol::parse_capabilities;
using mcplink::protocol::parse_progress;
using nlohmann::json;

TEST(CapabilitiesTest, ParsesExplicitBooleans) {
    auto parsed = parse_capabilities(json{{"tools", true},
                                          {"progress", true},
                                          {"completion", false},
                                          {"sampling", false},
                                          {"cancellation", true}});
    ASSERT_FALSE(is_error(parsed));
    const Capabilities& caps = get_value(parsed);
    EXPECT_TRUE(caps.tools);
    EXPECT_TRUE(caps.progress);
    EXPECT_FALSE(caps.completion);
    EXPECT_FALSE(caps.sampling);
    EXPECT_TRUE(caps.cancellation);
}

TEST(CapabilitiesTest, MissingKeysTakeDefaults) {
    auto parsed = parse_capabilities(json::object());
    ASSERT_FALSE(is_error(parsed));
    EXPECT_EQ(get_value(parsed), Capabilities{});
}

TEST(CapabilitiesTest, ObjectValueMeansSupported) {
    auto parsed = parse_capabilities(json{{"sampling", json::object()}, {"tools", false}});
    ASSERT_FALSE(is_error(parsed));
    EXPECT_TRUE(get_value(parsed).sampling);
    EXPECT_FALSE(get_value(parsed).tools);
}

TEST(CapabilitiesTest, RejectsNonObjectAndBadValues) {
    auto not_object = parse_capabilities(json::array());
    ASSERT_TRUE(is_error(not_object));
    EXPECT_EQ(get_error(not_object).kind, ErrorKind::Protocol);

    auto bad_value = parse_capabilities(json{{"tools", "yes"}});
    ASSERT_TRUE(is_error(bad_value));
    EXPECT_EQ(get_error(bad_value).code, "invalid_capabilities");
}

TEST(CapabilitiesTest, ToJsonListsEveryFlag) {
    const json encoded = mcplink::protocol::to_json(Capabilities{});
    EXPECT_EQ(encoded, (json{{"tools", true},
                             {"progress", true},
                             {"completion", false},
                             {"sampling", false},
                             {"cancellation", true}}));
}

TEST(ProgressTest, ParsesFullPayload) {
    auto parsed = parse_progress(json{{"operation_id", "op-1"},
                                      {"progress", 0.5},
                                      {"message", "halfway"},
                                      {"data", {{"files", 3}}},
                                      {"is_final", false}});
    ASSERT_FALSE(is_error(parsed));
    const auto& progress = get_value(parsed);
    EXPECT_EQ(progress.operation_id, "op-1");
    EXPECT_DOUBLE_EQ(progress.progress, 0.5);
    ASSERT_TRUE(progress.message.has_value());
    EXPECT_EQ(progress.message.value(), "halfway");
    ASSERT_TRUE(progress.data.has_value());
    EXPECT_EQ(progress.data->at("files"), 3);
    EXPECT_FALSE(progress.is_final);
}

TEST(ProgressTest, RejectsOutOfRangeProgress) {
    auto parsed = parse_progress(json{{"operation_id", "op-1"}, {"progress", 1.5}});
    ASSERT_TRUE(is_error(parsed));
    EXPECT_EQ(get_error(parsed).code, "invalid_progress");
    EXPECT_EQ(get_error(parsed).rpc_code, -32602);
}

TEST(ProgressTest, RejectsMissingOperationId) {
    auto parsed = parse_progress(json{{"progress", 0.1}});
    ASSERT_TRUE(is_error(parsed));
    EXPECT_EQ(get_error(parsed).kind, ErrorKind::Protocol);
}

}  // namespace
