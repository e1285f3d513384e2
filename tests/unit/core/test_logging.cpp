/**
 * @file test_logging.cpp
 * @brief Unit tests for structured logging and sensitive information masking
 */

#include <gtest/gtest.h>

#include <kcenon/p2p_convert/core/logging.h>

#include <string>
#include <vector>

namespace kcenon::p2p_convert::test {

// =============================================================================
// Masking Config Tests
// =============================================================================

class MaskingConfigTest : public ::testing::Test {};

TEST_F(MaskingConfigTest, DefaultConfig) {
    masking_config config;

    EXPECT_FALSE(config.mask_filenames);
    EXPECT_FALSE(config.mask_addresses);
    EXPECT_EQ(config.mask_char, '*');
    EXPECT_EQ(config.visible_chars, 4u);
}

TEST_F(MaskingConfigTest, AllMaskedConfig) {
    auto config = masking_config::all_masked();

    EXPECT_TRUE(config.mask_filenames);
    EXPECT_TRUE(config.mask_addresses);
}

// =============================================================================
// Sensitive Info Masker Tests
// =============================================================================

class SensitiveInfoMaskerTest : public ::testing::Test {};

TEST_F(SensitiveInfoMaskerTest, NoMaskingByDefault) {
    sensitive_info_masker masker;

    EXPECT_EQ(masker.mask_filename("quarterly_report.pdf"), "quarterly_report.pdf");
    EXPECT_EQ(masker.mask_address("192.168.1.12:9000"), "192.168.1.12:9000");
}

TEST_F(SensitiveInfoMaskerTest, MaskFilenameKeepsPrefixAndExtension) {
    sensitive_info_masker masker(masking_config::all_masked());

    EXPECT_EQ(masker.mask_filename("quarterly.pdf"), "quar*****.pdf");
    EXPECT_EQ(masker.mask_filename("notes"), "note*");
}

TEST_F(SensitiveInfoMaskerTest, ShortFilenameUnchanged) {
    sensitive_info_masker masker(masking_config::all_masked());

    EXPECT_EQ(masker.mask_filename("a.txt"), "a.txt");
    EXPECT_EQ(masker.mask_filename(".bashrc"), ".bas***");
}

TEST_F(SensitiveInfoMaskerTest, MaskAddressKeepsLastSegment) {
    sensitive_info_masker masker(masking_config::all_masked());

    EXPECT_EQ(masker.mask_address("10.0.0.12:9000"), "******.12:9000");
    EXPECT_EQ(masker.mask_address("localhost"), "*********");
    EXPECT_EQ(masker.mask_address(""), "");
}

// =============================================================================
// Transfer Log Context Tests
// =============================================================================

class TransferLogContextTest : public ::testing::Test {};

TEST_F(TransferLogContextTest, EmptyContext) {
    transfer_log_context ctx;
    EXPECT_EQ(ctx.to_json(), "{}");
}

TEST_F(TransferLogContextTest, PopulatedFields) {
    transfer_log_context ctx;
    ctx.transfer_id = "1a2b3c4d";
    ctx.filename = "report.txt";
    ctx.file_size = 2048;
    ctx.attempt = 3;
    ctx.peer_id = "peer-7";

    auto json = ctx.to_json();
    EXPECT_NE(json.find("\"transfer_id\":\"1a2b3c4d\""), std::string::npos);
    EXPECT_NE(json.find("\"filename\":\"report.txt\""), std::string::npos);
    EXPECT_NE(json.find("\"size\":2048"), std::string::npos);
    EXPECT_NE(json.find("\"attempt\":3"), std::string::npos);
    EXPECT_NE(json.find("\"peer_id\":\"peer-7\""), std::string::npos);
    EXPECT_EQ(json.find("bytes_transferred"), std::string::npos);
}

TEST_F(TransferLogContextTest, EscapesStrings) {
    transfer_log_context ctx;
    ctx.error_message = "bad \"quote\"\nnext";

    auto json = ctx.to_json();
    EXPECT_NE(json.find("bad \\\"quote\\\"\\nnext"), std::string::npos);
}

TEST_F(TransferLogContextTest, MaskingApplied) {
    transfer_log_context ctx;
    ctx.filename = "confidential.pdf";
    ctx.peer_address = "10.1.2.3:4000";

    sensitive_info_masker masker(masking_config::all_masked());
    auto json = ctx.to_json_with_masking(&masker);

    EXPECT_EQ(json.find("confidential"), std::string::npos);
    EXPECT_NE(json.find("conf********.pdf"), std::string::npos);
    EXPECT_NE(json.find(".3:4000"), std::string::npos);
}

// =============================================================================
// Log Entry Builder Tests
// =============================================================================

class LogEntryBuilderTest : public ::testing::Test {};

TEST_F(LogEntryBuilderTest, BuildsEntry) {
    auto entry = log_entry_builder()
                     .with_level(log_level::warn)
                     .with_category(log_category::retry)
                     .with_message("Attempt failed")
                     .with_attempt(2)
                     .with_error_message("connection refused")
                     .build();

    EXPECT_EQ(entry.level, log_level::warn);
    EXPECT_EQ(entry.category, "p2p_convert.retry");
    EXPECT_EQ(entry.message, "Attempt failed");
    ASSERT_TRUE(entry.context.has_value());
    EXPECT_EQ(entry.context->attempt, 2u);
    EXPECT_FALSE(entry.timestamp.empty());
}

TEST_F(LogEntryBuilderTest, JsonSplicesContext) {
    auto json = log_entry_builder()
                    .with_level(log_level::info)
                    .with_category(log_category::sender)
                    .with_message("done")
                    .with_transfer_id("abcd")
                    .with_source_location("file_sender.cpp", 42)
                    .build_json();

    EXPECT_NE(json.find("\"level\":\"INFO\""), std::string::npos);
    EXPECT_NE(json.find("\"message\":\"done\",\"transfer_id\":\"abcd\""), std::string::npos);
    EXPECT_NE(json.find("\"line\":42"), std::string::npos);
}

// =============================================================================
// Logger Tests
// =============================================================================

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        previous_level_ = get_logger().get_level();
        get_logger().set_level(log_level::debug);
        get_logger().set_callback([this](log_level level, std::string_view category,
                                         std::string_view message, const transfer_log_context*) {
            records_.push_back({level, std::string(category), std::string(message)});
        });
    }

    void TearDown() override {
        get_logger().set_callback(nullptr);
        get_logger().set_level(previous_level_);
    }

    struct record {
        log_level level;
        std::string category;
        std::string message;
    };

    log_level previous_level_ = log_level::info;
    std::vector<record> records_;
};

TEST_F(LoggerTest, LevelNames) {
    EXPECT_EQ(log_level_to_string(log_level::trace), "TRACE");
    EXPECT_EQ(log_level_to_string(log_level::warn), "WARN");
    EXPECT_EQ(log_level_to_string(log_level::fatal), "FATAL");
}

TEST_F(LoggerTest, CallbackReceivesRecords) {
    P2PC_LOG_INFO(log_category::receiver, "ready");
    P2PC_LOG_WARN(log_category::registry, "full");

    ASSERT_EQ(records_.size(), 2u);
    EXPECT_EQ(records_[0].level, log_level::info);
    EXPECT_EQ(records_[0].category, "p2p_convert.receiver");
    EXPECT_EQ(records_[1].message, "full");
}

TEST_F(LoggerTest, BelowLevelIsFiltered) {
    P2PC_LOG_TRACE(log_category::chunk, "chunk 1");
    EXPECT_TRUE(records_.empty());

    get_logger().set_level(log_level::error);
    P2PC_LOG_WARN(log_category::chunk, "ignored");
    P2PC_LOG_ERROR(log_category::chunk, "kept");
    ASSERT_EQ(records_.size(), 1u);
    EXPECT_EQ(records_[0].message, "kept");
}

TEST_F(LoggerTest, ContextMacroPassesContext) {
    const transfer_log_context* seen = nullptr;
    transfer_log_context ctx;
    ctx.transfer_id = "ctx-id";

    get_logger().set_callback([&seen](log_level, std::string_view, std::string_view,
                                      const transfer_log_context* context) { seen = context; });
    P2PC_LOG_INFO_CTX(log_category::transfer, "with context", ctx);

    ASSERT_NE(seen, nullptr);
    EXPECT_EQ(seen->transfer_id, "ctx-id");
}

TEST_F(LoggerTest, OutputFormatSwitch) {
    get_logger().set_output_format(log_output_format::json);
    EXPECT_EQ(get_logger().get_output_format(), log_output_format::json);
    get_logger().set_output_format(log_output_format::text);
    EXPECT_EQ(get_logger().get_output_format(), log_output_format::text);
}

}  // namespace kcenon::p2p_convert::test
