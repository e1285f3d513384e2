/**
 * @file test_core_types.cpp
 * @brief Unit tests for core types (error codes, transfer_id, transfer types)
 */

#include <gtest/gtest.h>

#include <kcenon/p2p_convert/core/chunk_types.h>
#include <kcenon/p2p_convert/core/error_codes.h>
#include <kcenon/p2p_convert/core/transfer_types.h>

#include <unordered_map>
#include <unordered_set>

namespace kcenon::p2p_convert::test {

// =============================================================================
// error_code Tests
// =============================================================================

class ErrorCodeTest : public ::testing::Test {};

TEST_F(ErrorCodeTest, ErrorCodeRanges) {
    EXPECT_EQ(static_cast<int>(error_code::connection_failed), -700);
    EXPECT_EQ(static_cast<int>(error_code::attempt_timeout), -707);
    EXPECT_EQ(static_cast<int>(error_code::invalid_frame), -720);
    EXPECT_EQ(static_cast<int>(error_code::capacity_exceeded), -740);
    EXPECT_EQ(static_cast<int>(error_code::incomplete_transfer), -760);
    EXPECT_EQ(static_cast<int>(error_code::invalid_transition), -770);
    EXPECT_EQ(static_cast<int>(error_code::transfer_cancelled), -780);
    EXPECT_EQ(static_cast<int>(error_code::conversion_failed), -785);
    EXPECT_EQ(static_cast<int>(error_code::invalid_configuration), -790);
}

TEST_F(ErrorCodeTest, ToString) {
    EXPECT_STREQ(to_string(error_code::success), "success");
    EXPECT_STREQ(to_string(error_code::connection_failed), "connection failed");
    EXPECT_STREQ(to_string(error_code::capacity_exceeded), "too many concurrent transfers");
    EXPECT_STREQ(to_string(static_cast<error_code>(-1)), "unknown error");
}

TEST_F(ErrorCodeTest, ErrorMessage) {
    EXPECT_EQ(error_message(-701), "connection timeout");
    EXPECT_EQ(error_message(-760), "incomplete transfer");
}

TEST_F(ErrorCodeTest, CategoryOf) {
    EXPECT_EQ(category_of(error_code::success), error_category::none);
    EXPECT_EQ(category_of(error_code::connection_refused), error_category::network);
    EXPECT_EQ(category_of(error_code::receive_timeout), error_category::network);
    EXPECT_EQ(category_of(error_code::malformed_message), error_category::protocol);
    EXPECT_EQ(category_of(error_code::file_too_large), error_category::resource);
    EXPECT_EQ(category_of(error_code::unknown_transfer), error_category::assembly);
    EXPECT_EQ(category_of(error_code::retries_exhausted), error_category::state);
    EXPECT_EQ(category_of(error_code::transfer_cancelled), error_category::cancellation);
    EXPECT_EQ(category_of(error_code::unsupported_conversion), error_category::conversion);
    EXPECT_EQ(category_of(error_code::internal_error), error_category::configuration);
}

TEST_F(ErrorCodeTest, IsRetryable) {
    EXPECT_TRUE(is_retryable(error_code::connection_failed));
    EXPECT_TRUE(is_retryable(error_code::connection_timeout));
    EXPECT_TRUE(is_retryable(error_code::send_failed));
    EXPECT_TRUE(is_retryable(error_code::attempt_timeout));

    EXPECT_FALSE(is_retryable(error_code::success));
    EXPECT_FALSE(is_retryable(error_code::protocol_mismatch));
    EXPECT_FALSE(is_retryable(error_code::transfer_rejected));
    EXPECT_FALSE(is_retryable(error_code::file_not_found));
    EXPECT_FALSE(is_retryable(error_code::transfer_cancelled));
    EXPECT_FALSE(is_retryable(error_code::invalid_configuration));

    EXPECT_TRUE(is_retryable(error{error_code::connection_lost, "closed"}));
}

TEST_F(ErrorCodeTest, ErrorDefaultMessage) {
    error err(error_code::file_not_found);
    EXPECT_TRUE(static_cast<bool>(err));
    EXPECT_EQ(err.message, "file not found");

    error none;
    EXPECT_FALSE(static_cast<bool>(none));
}

TEST_F(ErrorCodeTest, ResultHoldsValueOrError) {
    result<int> ok = 7;
    ASSERT_TRUE(ok.has_value());
    EXPECT_EQ(ok.value(), 7);

    result<int> failed = unexpected{error{error_code::internal_error, "boom"}};
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().message, "boom");

    result<void> done;
    EXPECT_TRUE(done.has_value());
}

// =============================================================================
// transfer_id Tests
// =============================================================================

class TransferIdTest : public ::testing::Test {};

TEST_F(TransferIdTest, DefaultConstruction) {
    transfer_id id;
    EXPECT_TRUE(id.is_null());
}

TEST_F(TransferIdTest, GenerateIsVersion4) {
    auto id = transfer_id::generate();
    EXPECT_FALSE(id.is_null());
    EXPECT_EQ(id.bytes[6] & 0xF0, 0x40);
    EXPECT_EQ(id.bytes[8] & 0xC0, 0x80);
}

TEST_F(TransferIdTest, GenerateUniqueness) {
    std::unordered_set<transfer_id> ids;
    for (int i = 0; i < 1000; ++i) {
        ids.insert(transfer_id::generate());
    }
    EXPECT_EQ(ids.size(), 1000u);
}

TEST_F(TransferIdTest, ToStringCanonicalForm) {
    auto str = transfer_id::generate().to_string();
    ASSERT_EQ(str.size(), 36u);
    EXPECT_EQ(str[8], '-');
    EXPECT_EQ(str[13], '-');
    EXPECT_EQ(str[14], '4');
    EXPECT_EQ(str[18], '-');
    EXPECT_EQ(str[23], '-');
}

TEST_F(TransferIdTest, FromStringRoundTrip) {
    auto id = transfer_id::generate();
    auto parsed = transfer_id::from_string(id.to_string());
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, id);
}

TEST_F(TransferIdTest, FromStringInvalid) {
    EXPECT_FALSE(transfer_id::from_string("").has_value());
    EXPECT_FALSE(transfer_id::from_string("not-a-uuid").has_value());
    EXPECT_FALSE(transfer_id::from_string("zzzzzzzz-zzzz-4zzz-8zzz-zzzzzzzzzzzz").has_value());
    EXPECT_FALSE(transfer_id::from_string("12345678-1234-4123-8123-1234567890").has_value());
}

TEST_F(TransferIdTest, ShortStringIsPrefix) {
    auto id = transfer_id::generate();
    EXPECT_EQ(id.short_string().size(), 8u);
    EXPECT_EQ(id.to_string().rfind(id.short_string(), 0), 0u);
}

TEST_F(TransferIdTest, EqualityAndOrdering) {
    auto a = transfer_id::generate();
    auto b = a;
    auto c = transfer_id::generate();

    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_TRUE((a < c) != (c < a));
}

TEST_F(TransferIdTest, UseInUnorderedMap) {
    std::unordered_map<transfer_id, int> map;
    auto id = transfer_id::generate();
    map[id] = 3;
    EXPECT_EQ(map.at(id), 3);
}

// =============================================================================
// transfer_types Tests
// =============================================================================

class TransferTypesTest : public ::testing::Test {};

TEST_F(TransferTypesTest, ProtocolId) {
    EXPECT_EQ(protocol_id, "/convert/1.0.0");
}

TEST_F(TransferTypesTest, StatusNames) {
    EXPECT_EQ(to_string(transfer_status::connecting), "connecting");
    EXPECT_EQ(to_string(transfer_status::waiting_response), "waiting_response");
    EXPECT_EQ(to_string(transfer_status::cancelled), "cancelled");
}

TEST_F(TransferTypesTest, TerminalStatuses) {
    EXPECT_FALSE(is_terminal_status(transfer_status::connecting));
    EXPECT_FALSE(is_terminal_status(transfer_status::negotiating));
    EXPECT_FALSE(is_terminal_status(transfer_status::sending));
    EXPECT_FALSE(is_terminal_status(transfer_status::waiting_response));
    EXPECT_TRUE(is_terminal_status(transfer_status::completed));
    EXPECT_TRUE(is_terminal_status(transfer_status::failed));
    EXPECT_TRUE(is_terminal_status(transfer_status::cancelled));
}

TEST_F(TransferTypesTest, FileFormatNames) {
    EXPECT_EQ(to_string(file_format::pdf), "PDF");
    EXPECT_EQ(to_string(file_format::text), "Text");
    EXPECT_EQ(to_string(file_format::unknown), "Unknown");
}

TEST_F(TransferTypesTest, PeerAddressToString) {
    EXPECT_EQ(peer_address("peer-1", "10.0.0.1:4000").to_string(), "peer-1@10.0.0.1:4000");
    EXPECT_EQ(peer_address("peer-1", "").to_string(), "peer-1");
}

TEST_F(TransferTypesTest, RejectedResponse) {
    auto id = transfer_id::generate();
    auto response = transfer_response::rejected(id, "no room");

    EXPECT_EQ(response.id, id);
    EXPECT_FALSE(response.success);
    ASSERT_TRUE(response.error.has_value());
    EXPECT_EQ(*response.error, "no room");
    EXPECT_FALSE(response.converted_data.has_value());
}

}  // namespace kcenon::p2p_convert::test
