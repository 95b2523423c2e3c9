/**
 * @file test_error_classifier.cpp
 * @brief Unit tests for error codes and error_classifier
 */

#include <gtest/gtest.h>

#include <kcenon/object_transfer/core/error_classifier.h>

#include <algorithm>
#include <system_error>

namespace kcenon::object_transfer::test {

class ErrorClassifierTest : public ::testing::Test {
protected:
    static auto has_suggestion(const classified_error& e, const std::string& text) -> bool {
        auto list = e.suggestions();
        return std::find(list.begin(), list.end(), text) != list.end();
    }
};

TEST_F(ErrorClassifierTest, ErrorCode_RangesAreDisjoint) {
    EXPECT_TRUE(is_network_error(error_code::request_timeout));
    EXPECT_TRUE(is_storage_error(error_code::access_denied));
    EXPECT_TRUE(is_filesystem_error(error_code::disk_full));
    EXPECT_TRUE(is_validation_error(error_code::checksum_mismatch));
    EXPECT_TRUE(is_control_error(error_code::transfer_cancelled));
    EXPECT_TRUE(is_internal_error(error_code::internal_error));

    EXPECT_FALSE(is_network_error(error_code::access_denied));
    EXPECT_FALSE(is_storage_error(error_code::disk_full));
    EXPECT_EQ(to_int(error_code::request_timeout), -800);
}

TEST_F(ErrorClassifierTest, Classify_AccessDenied) {
    auto c = error_classifier::classify(error{error_code::access_denied, "Access Denied"});

    EXPECT_EQ(c.category, error_category::storage_service);
    EXPECT_EQ(c.severity, error_severity::high);
    EXPECT_FALSE(c.retryable);
    EXPECT_EQ(c.title(), "Access Denied");
    EXPECT_TRUE(has_suggestion(c, "Verify your AWS credentials"));
}

TEST_F(ErrorClassifierTest, Classify_TimeoutIsRetryableNetwork) {
    auto c = error_classifier::classify(error{error_code::request_timeout, "timed out"});

    EXPECT_EQ(c.category, error_category::network);
    EXPECT_EQ(c.severity, error_severity::medium);
    EXPECT_TRUE(c.retryable);
    EXPECT_EQ(c.title(), "Connection Timeout");
    EXPECT_TRUE(has_suggestion(c, "Check your internet connection"));
}

TEST_F(ErrorClassifierTest, Classify_ConnectionLostIsRetryable) {
    auto c = error_classifier::classify(error{error_code::connection_lost});
    EXPECT_EQ(c.category, error_category::network);
    EXPECT_TRUE(c.retryable);
}

TEST_F(ErrorClassifierTest, Classify_InvalidCredentialsIsCritical) {
    auto c = error_classifier::classify(error{error_code::invalid_credentials});

    EXPECT_EQ(c.category, error_category::storage_service);
    EXPECT_EQ(c.severity, error_severity::critical);
    EXPECT_FALSE(c.retryable);
    EXPECT_TRUE(has_suggestion(c, "Update your AWS access key and secret key"));
}

TEST_F(ErrorClassifierTest, Classify_DiskFullIsCriticalFilesystem) {
    auto c = error_classifier::classify(error{error_code::disk_full});

    EXPECT_EQ(c.category, error_category::filesystem);
    EXPECT_EQ(c.severity, error_severity::critical);
    EXPECT_FALSE(c.retryable);
    EXPECT_TRUE(has_suggestion(c, "Free up disk space"));
}

TEST_F(ErrorClassifierTest, Classify_HttpStatusNarrowing) {
    auto forbidden = error_classifier::classify(error{error_code::http_error, "", 403});
    EXPECT_EQ(forbidden.code, error_code::access_denied);
    EXPECT_EQ(forbidden.category, error_category::storage_service);

    auto missing = error_classifier::classify(error{error_code::http_error, "", 404});
    EXPECT_EQ(missing.code, error_code::object_not_found);

    auto server = error_classifier::classify(error{error_code::http_error, "", 503});
    EXPECT_EQ(server.category, error_category::unknown);
    EXPECT_EQ(server.severity, error_severity::high);
    ASSERT_TRUE(server.status_code.has_value());
    EXPECT_EQ(*server.status_code, 503);

    auto client = error_classifier::classify(error{error_code::http_error, "", 409});
    EXPECT_EQ(client.severity, error_severity::medium);
    EXPECT_FALSE(client.retryable);
}

TEST_F(ErrorClassifierTest, Classify_ValidationAndControl) {
    auto mismatch = error_classifier::classify(error{error_code::checksum_mismatch});
    EXPECT_EQ(mismatch.category, error_category::validation);
    EXPECT_EQ(mismatch.severity, error_severity::high);

    auto path = error_classifier::classify(error{error_code::invalid_path});
    EXPECT_EQ(path.severity, error_severity::medium);

    auto control = error_classifier::classify(error{error_code::transfer_not_found});
    EXPECT_EQ(control.category, error_category::validation);
    EXPECT_EQ(control.severity, error_severity::low);
    EXPECT_FALSE(control.retryable);
}

TEST_F(ErrorClassifierTest, Classify_EmptyMessageFallsBackToCodeText) {
    auto c = error_classifier::classify(error{error_code::dns_failure});
    EXPECT_FALSE(c.message.empty());
}

TEST_F(ErrorClassifierTest, Suggestions_AlwaysPointAtLogs) {
    auto c = error_classifier::classify(error{error_code::internal_error, "boom"});
    EXPECT_EQ(c.suggestions().back(), "Check the application logs for more details");
}

TEST_F(ErrorClassifierTest, ToError_KeepsCodeAndStatus) {
    auto c = error_classifier::classify(error{error_code::http_error, "teapot", 418});
    auto e = c.to_error();
    EXPECT_EQ(e.code, error_code::http_error);
    EXPECT_EQ(e.message, "teapot");
    ASSERT_TRUE(e.status_code.has_value());
    EXPECT_EQ(*e.status_code, 418);
}

TEST_F(ErrorClassifierTest, FromHttpStatus) {
    EXPECT_EQ(error_classifier::from_http_status(403, "x").code, error_code::access_denied);
    EXPECT_EQ(error_classifier::from_http_status(404, "x").code,
              error_code::object_not_found);
    auto other = error_classifier::from_http_status(500, "x");
    EXPECT_EQ(other.code, error_code::http_error);
    ASSERT_TRUE(other.status_code.has_value());
    EXPECT_EQ(*other.status_code, 500);
}

TEST_F(ErrorClassifierTest, FromFilesystem) {
    auto full = error_classifier::from_filesystem(
        std::make_error_code(std::errc::no_space_on_device),
        error_code::file_write_error, "write");
    EXPECT_EQ(full.code, error_code::disk_full);

    auto denied = error_classifier::from_filesystem(
        std::make_error_code(std::errc::permission_denied),
        error_code::file_write_error, "open");
    EXPECT_EQ(denied.code, error_code::permission_denied);

    auto missing = error_classifier::from_filesystem(
        std::make_error_code(std::errc::no_such_file_or_directory),
        error_code::file_read_error, "open");
    EXPECT_EQ(missing.code, error_code::file_not_found);

    auto other = error_classifier::from_filesystem(
        std::make_error_code(std::errc::io_error), error_code::file_read_error, "read");
    EXPECT_EQ(other.code, error_code::file_read_error);
    EXPECT_EQ(other.message.rfind("read: ", 0), 0u);
}

}  // namespace kcenon::object_transfer::test
