/**
 * @file test_logging.cpp
 * @brief Unit tests for structured transfer logging
 */

#include <gtest/gtest.h>

#include <kcenon/object_transfer/core/logging.h>

#include <mutex>
#include <string>
#include <vector>

namespace kcenon::object_transfer::test {

// =============================================================================
// Log Context Tests
// =============================================================================

TEST(TransferLogContextTest, EmptyContext) {
    transfer_log_context ctx;
    EXPECT_EQ(ctx.to_json(), "{}");
}

TEST(TransferLogContextTest, OnlySetFieldsRendered) {
    transfer_log_context ctx;
    ctx.transfer_id = "42";
    ctx.object_key = "photos/cat.jpg";
    ctx.part_number = 3;
    ctx.total_parts = 5;

    auto json = ctx.to_json();
    EXPECT_NE(json.find("\"transfer_id\":\"42\""), std::string::npos);
    EXPECT_NE(json.find("\"object_key\":\"photos/cat.jpg\""), std::string::npos);
    EXPECT_NE(json.find("\"part_number\":3"), std::string::npos);
    EXPECT_NE(json.find("\"total_parts\":5"), std::string::npos);
    EXPECT_EQ(json.find("upload_id"), std::string::npos);
    EXPECT_EQ(json.find("rate_mbps"), std::string::npos);
}

TEST(TransferLogContextTest, EscapesSpecialCharacters) {
    transfer_log_context ctx;
    ctx.error_message = "line1\nsaid \"no\"";

    auto json = ctx.to_json();
    EXPECT_NE(json.find("line1\\nsaid \\\"no\\\""), std::string::npos);
}

TEST(TransferLogContextTest, RateFormattedWithTwoDecimals) {
    transfer_log_context ctx;
    ctx.rate_mbps = 12.345;
    EXPECT_NE(ctx.to_json().find("\"rate_mbps\":12.35"), std::string::npos);
}

// =============================================================================
// Logger Tests
// =============================================================================

class ObjectTransferLoggerTest : public ::testing::Test {
protected:
    struct record {
        log_level level;
        std::string category;
        std::string message;
        bool has_context;
    };

    void SetUp() override {
        saved_level_ = get_logger().get_level();
        get_logger().set_callback(
            [this](log_level level, std::string_view category, std::string_view message,
                   const transfer_log_context* ctx) {
                std::lock_guard lock(mutex_);
                records_.push_back(
                    {level, std::string(category), std::string(message), ctx != nullptr});
            });
    }

    void TearDown() override {
        get_logger().set_callback(nullptr);
        get_logger().set_level(saved_level_);
        get_logger().set_output_format(log_output_format::text);
    }

    auto captured() -> std::vector<record> {
        std::lock_guard lock(mutex_);
        return records_;
    }

    log_level saved_level_ = log_level::info;
    std::mutex mutex_;
    std::vector<record> records_;
};

TEST_F(ObjectTransferLoggerTest, LevelToString) {
    EXPECT_EQ(log_level_to_string(log_level::trace), "TRACE");
    EXPECT_EQ(log_level_to_string(log_level::warn), "WARN");
    EXPECT_EQ(log_level_to_string(log_level::fatal), "FATAL");
}

TEST_F(ObjectTransferLoggerTest, LevelFiltering) {
    get_logger().set_level(log_level::warn);
    EXPECT_FALSE(get_logger().is_enabled(log_level::info));
    EXPECT_TRUE(get_logger().is_enabled(log_level::error));

    OT_LOG_INFO(log_category::upload, "dropped");
    OT_LOG_WARN(log_category::upload, "kept");

    auto records = captured();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].level, log_level::warn);
    EXPECT_EQ(records[0].category, "object_transfer.upload");
    EXPECT_EQ(records[0].message, "kept");
}

TEST_F(ObjectTransferLoggerTest, ContextPassedToCallback) {
    get_logger().set_level(log_level::debug);

    transfer_log_context ctx;
    ctx.transfer_id = "7";
    OT_LOG_DEBUG_CTX(log_category::download, "chunk written", ctx);
    OT_LOG_DEBUG(log_category::download, "no context");

    auto records = captured();
    ASSERT_EQ(records.size(), 2u);
    EXPECT_TRUE(records[0].has_context);
    EXPECT_FALSE(records[1].has_context);
}

TEST_F(ObjectTransferLoggerTest, OutputFormatSwitch) {
    EXPECT_EQ(get_logger().get_output_format(), log_output_format::text);
    get_logger().set_output_format(log_output_format::json);
    EXPECT_EQ(get_logger().get_output_format(), log_output_format::json);

    get_logger().set_level(log_level::info);
    OT_LOG_INFO(log_category::manager, "json record");
    EXPECT_EQ(captured().size(), 1u);
}

TEST_F(ObjectTransferLoggerTest, InitializeIsIdempotent) {
    get_logger().initialize();
    get_logger().initialize();
    EXPECT_TRUE(get_logger().is_initialized());
    get_logger().flush();
}

}  // namespace kcenon::object_transfer::test
