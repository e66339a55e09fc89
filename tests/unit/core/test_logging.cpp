/**
 * @file test_logging.cpp
 * @brief Unit tests for structured logging and credential masking
 */

#include <gtest/gtest.h>

#include <kcenon/chunked_upload/core/logging.h>

#include <string>
#include <tuple>
#include <vector>

namespace kcenon::chunked_upload::test {

// =============================================================================
// Masking Config Tests
// =============================================================================

class MaskingConfigTest : public ::testing::Test {};

TEST_F(MaskingConfigTest, DefaultConfigMasksCredentialsOnly) {
    masking_config config;

    EXPECT_FALSE(config.mask_paths);
    EXPECT_TRUE(config.mask_credentials);
    EXPECT_EQ(config.mask_char, "*");
    EXPECT_EQ(config.visible_chars, 4u);
}

TEST_F(MaskingConfigTest, AllMaskedConfig) {
    auto config = masking_config::all_masked();

    EXPECT_TRUE(config.mask_paths);
    EXPECT_TRUE(config.mask_credentials);
}

TEST_F(MaskingConfigTest, NoneConfig) {
    auto config = masking_config::none();

    EXPECT_FALSE(config.mask_paths);
    EXPECT_FALSE(config.mask_credentials);
}

// =============================================================================
// Sensitive Info Masker Tests
// =============================================================================

class SensitiveInfoMaskerTest : public ::testing::Test {};

TEST_F(SensitiveInfoMaskerTest, PlainTextUnchanged) {
    sensitive_info_masker masker;
    std::string input = "Uploaded chunk 3 of 10";

    EXPECT_EQ(masker.mask(input), input);
}

TEST_F(SensitiveInfoMaskerTest, MasksBasicAuthorizationHeader) {
    sensitive_info_masker masker;

    auto result = masker.mask("Authorization: Basic dXNlcjp0b2tlbg==");

    EXPECT_EQ(result.find("dXNlcjp0b2tlbg=="), std::string::npos);
    EXPECT_NE(result.find("Basic ********"), std::string::npos);
}

TEST_F(SensitiveInfoMaskerTest, MasksRegisteredSecret) {
    sensitive_info_masker masker;
    masker.add_secret("api-token-1234567");

    auto result = masker.mask("token api-token-1234567 rejected, retry api-token-1234567");

    EXPECT_EQ(result.find("api-token-1234567"), std::string::npos);
    EXPECT_EQ(result, "token ******** rejected, retry ********");
}

TEST_F(SensitiveInfoMaskerTest, IgnoresTooShortSecrets) {
    sensitive_info_masker masker;
    masker.add_secret("ab");

    EXPECT_EQ(masker.mask("ab cd"), "ab cd");
}

TEST_F(SensitiveInfoMaskerTest, CredentialMaskingCanBeDisabled) {
    sensitive_info_masker masker(masking_config::none());
    masker.add_secret("api-token-1234567");

    std::string input = "Basic dXNlcjp0b2tlbg== api-token-1234567";
    EXPECT_EQ(masker.mask(input), input);
}

TEST_F(SensitiveInfoMaskerTest, MaskFilePath) {
    masking_config config;
    config.mask_paths = true;
    sensitive_info_masker masker(config);

    auto result = masker.mask_path("/home/user/documents/archive.tar");

    EXPECT_NE(result.find("archive.tar"), std::string::npos);
    EXPECT_EQ(result.find("/home/"), std::string::npos);
}

TEST_F(SensitiveInfoMaskerTest, PathsKeptByDefault) {
    sensitive_info_masker masker;
    EXPECT_EQ(masker.mask_path("/home/user/archive.tar"), "/home/user/archive.tar");
}

TEST_F(SensitiveInfoMaskerTest, MaskPathsInText) {
    sensitive_info_masker masker(masking_config::all_masked());

    auto result = masker.mask("Cannot open /home/user/data.zip for reading");

    EXPECT_EQ(result.find("/home/user/"), std::string::npos);
    EXPECT_NE(result.find("data.zip"), std::string::npos);
}

TEST_F(SensitiveInfoMaskerTest, EmptyInput) {
    sensitive_info_masker masker(masking_config::all_masked());

    EXPECT_EQ(masker.mask(""), "");
    EXPECT_EQ(masker.mask_path(""), "");
}

// =============================================================================
// Upload Log Context Tests
// =============================================================================

class UploadLogContextTest : public ::testing::Test {};

TEST_F(UploadLogContextTest, EmptyContextToJson) {
    upload_log_context ctx;
    EXPECT_EQ(ctx.to_json(), "{}");
}

TEST_F(UploadLogContextTest, BasicFieldsToJson) {
    upload_log_context ctx;
    ctx.session_id = "upl-42";
    ctx.resource_key = "PROJ-1";
    ctx.chunk_index = 3;

    auto json = ctx.to_json();

    EXPECT_NE(json.find("\"session_id\":\"upl-42\""), std::string::npos);
    EXPECT_NE(json.find("\"resource_key\":\"PROJ-1\""), std::string::npos);
    EXPECT_NE(json.find("\"chunk_index\":3"), std::string::npos);
}

TEST_F(UploadLogContextTest, AllFieldsToJson) {
    upload_log_context ctx;
    ctx.session_id = "upl-42";
    ctx.resource_key = "PROJ-1";
    ctx.filename = "archive.tar";
    ctx.file_size = 1024;
    ctx.chunk_index = 2;
    ctx.total_chunks = 5;
    ctx.part_number = 3;
    ctx.operation = "probe";
    ctx.attempt = 2;
    ctx.status_code = 503;
    ctx.duration_ms = 150;
    ctx.error_message = "unexpected HTTP status 503";

    auto json = ctx.to_json();

    EXPECT_NE(json.find("\"filename\":\"archive.tar\""), std::string::npos);
    EXPECT_NE(json.find("\"size\":1024"), std::string::npos);
    EXPECT_NE(json.find("\"total_chunks\":5"), std::string::npos);
    EXPECT_NE(json.find("\"part_number\":3"), std::string::npos);
    EXPECT_NE(json.find("\"operation\":\"probe\""), std::string::npos);
    EXPECT_NE(json.find("\"attempt\":2"), std::string::npos);
    EXPECT_NE(json.find("\"status_code\":503"), std::string::npos);
    EXPECT_NE(json.find("\"duration_ms\":150"), std::string::npos);
    EXPECT_NE(json.find("\"error_message\":\"unexpected HTTP status 503\""),
              std::string::npos);
}

TEST_F(UploadLogContextTest, JsonWithMasking) {
    upload_log_context ctx;
    ctx.filename = "/home/user/archive.tar";

    sensitive_info_masker masker(masking_config::all_masked());
    auto json = ctx.to_json_with_masking(&masker);

    EXPECT_EQ(json.find("/home/user/"), std::string::npos);
    EXPECT_NE(json.find("archive.tar"), std::string::npos);
}

TEST_F(UploadLogContextTest, JsonEscaping) {
    upload_log_context ctx;
    ctx.filename = "file\"with\"quotes.txt";
    ctx.error_message = "line1\nline2";

    auto json = ctx.to_json();

    EXPECT_NE(json.find("file\\\"with\\\"quotes.txt"), std::string::npos);
    EXPECT_NE(json.find("line1\\nline2"), std::string::npos);
}

// =============================================================================
// Log Entry Builder Tests
// =============================================================================

class LogEntryBuilderTest : public ::testing::Test {};

TEST_F(LogEntryBuilderTest, BasicBuilder) {
    auto entry = log_entry_builder()
        .with_level(log_level::info)
        .with_category(log_category::session)
        .with_message("Upload session created")
        .build();

    EXPECT_EQ(entry.level, log_level::info);
    EXPECT_EQ(entry.category, log_category::session);
    EXPECT_EQ(entry.message, "Upload session created");
    EXPECT_FALSE(entry.context.has_value());
}

TEST_F(LogEntryBuilderTest, BuilderWithContextFields) {
    auto entry = log_entry_builder()
        .with_level(log_level::warn)
        .with_category(log_category::dispatcher)
        .with_message("Chunk failed")
        .with_session_id("upl-1")
        .with_filename("big.iso")
        .with_chunk_index(7)
        .with_operation("upload")
        .with_error_message("HTTP 503")
        .build();

    ASSERT_TRUE(entry.context.has_value());
    EXPECT_EQ(entry.context->session_id, "upl-1");
    EXPECT_EQ(entry.context->filename, "big.iso");
    EXPECT_EQ(entry.context->chunk_index, 7u);
    EXPECT_EQ(entry.context->operation, "upload");
    EXPECT_EQ(entry.context->error_message, "HTTP 503");
}

TEST_F(LogEntryBuilderTest, BuilderWithSourceLocation) {
    auto entry = log_entry_builder()
        .with_message("located")
        .with_source_location("upload_session.cpp", 42, "create")
        .build();

    auto json = entry.to_json();
    EXPECT_NE(json.find("\"file\":\"upload_session.cpp\""), std::string::npos);
    EXPECT_NE(json.find("\"line\":42"), std::string::npos);
    EXPECT_NE(json.find("\"function\":\"create\""), std::string::npos);
}

TEST_F(LogEntryBuilderTest, BuildJsonMergesContext) {
    upload_log_context ctx;
    ctx.session_id = "upl-9";

    auto json = log_entry_builder()
        .with_level(log_level::error)
        .with_category(log_category::retry)
        .with_message("gave up")
        .with_context(ctx)
        .build_json();

    EXPECT_NE(json.find("\"level\":\"ERROR\""), std::string::npos);
    EXPECT_NE(json.find("\"category\":\"chunked_upload.retry\""), std::string::npos);
    EXPECT_NE(json.find("\"session_id\":\"upl-9\""), std::string::npos);
}

TEST_F(LogEntryBuilderTest, TimestampFormat) {
    auto entry = log_entry_builder().build();

    // 2025-01-01T00:00:00.000Z
    ASSERT_EQ(entry.timestamp.size(), 24u);
    EXPECT_EQ(entry.timestamp[10], 'T');
    EXPECT_EQ(entry.timestamp.back(), 'Z');
}

// =============================================================================
// Log Level Tests
// =============================================================================

class LogLevelTest : public ::testing::Test {};

TEST_F(LogLevelTest, LogLevelToString) {
    EXPECT_EQ(log_level_to_string(log_level::trace), "TRACE");
    EXPECT_EQ(log_level_to_string(log_level::debug), "DEBUG");
    EXPECT_EQ(log_level_to_string(log_level::info), "INFO");
    EXPECT_EQ(log_level_to_string(log_level::warn), "WARN");
    EXPECT_EQ(log_level_to_string(log_level::error), "ERROR");
    EXPECT_EQ(log_level_to_string(log_level::fatal), "FATAL");
}

// =============================================================================
// Logger Integration Tests
// =============================================================================

class ChunkedUploadLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        get_logger().initialize();
        get_logger().set_level(log_level::trace);
        get_logger().enable_json_output(false);
        get_logger().set_masking_config(masking_config{});
    }

    void TearDown() override {
        get_logger().set_callback(nullptr);
        get_logger().set_json_callback(nullptr);
        get_logger().enable_json_output(false);
        get_logger().set_level(log_level::info);
    }
};

TEST_F(ChunkedUploadLoggerTest, SetOutputFormat) {
    get_logger().set_output_format(log_output_format::json);
    EXPECT_EQ(get_logger().get_output_format(), log_output_format::json);

    get_logger().set_output_format(log_output_format::text);
    EXPECT_EQ(get_logger().get_output_format(), log_output_format::text);
}

TEST_F(ChunkedUploadLoggerTest, LogCallback) {
    std::vector<std::tuple<log_level, std::string, std::string>> captured;

    get_logger().set_callback([&](log_level level, std::string_view category,
                                  std::string_view message, const upload_log_context*) {
        captured.emplace_back(level, std::string(category), std::string(message));
    });

    CU_LOG_INFO(log_category::uploader, "Test message");

    ASSERT_EQ(captured.size(), 1u);
    EXPECT_EQ(std::get<0>(captured[0]), log_level::info);
    EXPECT_EQ(std::get<1>(captured[0]), log_category::uploader);
    EXPECT_EQ(std::get<2>(captured[0]), "Test message");
}

TEST_F(ChunkedUploadLoggerTest, JsonCallback) {
    std::vector<std::string> captured_json;

    get_logger().enable_json_output(true);
    get_logger().set_json_callback([&](const structured_log_entry&, const std::string& json) {
        captured_json.push_back(json);
    });

    CU_LOG_INFO(log_category::uploader, "JSON test");

    ASSERT_EQ(captured_json.size(), 1u);
    EXPECT_NE(captured_json[0].find("\"level\":\"INFO\""), std::string::npos);
    EXPECT_NE(captured_json[0].find("\"message\":\"JSON test\""), std::string::npos);
}

TEST_F(ChunkedUploadLoggerTest, LogLevelFiltering) {
    std::vector<std::string> captured;

    get_logger().set_callback([&](log_level, std::string_view,
                                  std::string_view message, const upload_log_context*) {
        captured.push_back(std::string(message));
    });

    get_logger().set_level(log_level::warn);

    CU_LOG_DEBUG(log_category::uploader, "Debug message");
    CU_LOG_INFO(log_category::uploader, "Info message");
    CU_LOG_WARN(log_category::uploader, "Warn message");
    CU_LOG_ERROR(log_category::uploader, "Error message");

    ASSERT_EQ(captured.size(), 2u);
    EXPECT_EQ(captured[0], "Warn message");
    EXPECT_EQ(captured[1], "Error message");
}

TEST_F(ChunkedUploadLoggerTest, RegisteredSecretNeverReachesOutput) {
    std::vector<std::string> captured;
    std::vector<std::string> captured_json;

    get_logger().register_secret("logger-test-secret-token");
    get_logger().set_callback([&](log_level, std::string_view,
                                  std::string_view message, const upload_log_context*) {
        captured.push_back(std::string(message));
    });
    get_logger().set_json_callback([&](const structured_log_entry&, const std::string& json) {
        captured_json.push_back(json);
    });
    get_logger().enable_json_output(true);

    CU_LOG_WARN(log_category::transport, "request with logger-test-secret-token failed");

    ASSERT_EQ(captured.size(), 1u);
    ASSERT_EQ(captured_json.size(), 1u);
    EXPECT_EQ(captured[0].find("logger-test-secret-token"), std::string::npos);
    EXPECT_EQ(captured_json[0].find("logger-test-secret-token"), std::string::npos);
}

TEST_F(ChunkedUploadLoggerTest, ContextIsPassedToCallback) {
    std::optional<uint64_t> seen_index;

    get_logger().set_callback([&](log_level, std::string_view, std::string_view,
                                  const upload_log_context* ctx) {
        if (ctx) {
            seen_index = ctx->chunk_index;
        }
    });

    upload_log_context ctx;
    ctx.chunk_index = 4;
    CU_LOG_DEBUG_CTX(log_category::dispatcher, "Chunk uploaded", ctx);

    ASSERT_TRUE(seen_index.has_value());
    EXPECT_EQ(*seen_index, 4u);
}

}  // namespace kcenon::chunked_upload::test
