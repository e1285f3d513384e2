/**
 * @file test_chunk_codec.cpp
 * @brief Unit tests for chunk_codec split and reassembly
 */

#include <gtest/gtest.h>

#include <kcenon/p2p_convert/core/checksum.h>
#include <kcenon/p2p_convert/core/chunk_codec.h>

#include <algorithm>
#include <map>
#include <random>
#include <vector>

namespace kcenon::p2p_convert::test {

class ChunkCodecTest : public ::testing::Test {
protected:
    void SetUp() override { id_ = transfer_id::generate(); }

    static auto make_payload(std::size_t size, uint32_t seed = 42) -> byte_buffer {
        byte_buffer data(size);
        std::mt19937 gen(seed);
        std::uniform_int_distribution<> dis(0, 255);
        for (auto& b : data) {
            b = static_cast<std::byte>(dis(gen));
        }
        return data;
    }

    static auto to_map(const std::vector<chunk>& chunks) -> std::map<uint64_t, byte_buffer> {
        std::map<uint64_t, byte_buffer> received;
        for (const auto& c : chunks) {
            received.emplace(c.index, c.data);
        }
        return received;
    }

    transfer_id id_;
};

// split Tests

TEST_F(ChunkCodecTest, Split_ZeroChunkSizeRejected) {
    auto data = make_payload(100);
    auto result = chunk_codec::split(data, 0, id_);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::invalid_configuration);
}

TEST_F(ChunkCodecTest, Split_EmptyBufferYieldsNoChunks) {
    byte_buffer empty;
    auto result = chunk_codec::split(empty, 1024, id_);
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result.value().empty());
}

TEST_F(ChunkCodecTest, Split_ExactMultiple) {
    auto data = make_payload(4096);
    auto result = chunk_codec::split(data, 1024, id_);
    ASSERT_TRUE(result.has_value());

    const auto& chunks = result.value();
    ASSERT_EQ(chunks.size(), 4u);
    for (std::size_t i = 0; i < chunks.size(); ++i) {
        EXPECT_EQ(chunks[i].index, i);
        EXPECT_EQ(chunks[i].size(), 1024u);
        EXPECT_EQ(chunks[i].id, id_);
        EXPECT_EQ(chunks[i].is_final, i == 3);
    }
}

TEST_F(ChunkCodecTest, Split_TwoAndAHalfMegabytes) {
    constexpr std::size_t mib = 1024 * 1024;
    auto data = make_payload(2 * mib + mib / 2);
    auto result = chunk_codec::split(data, mib, id_);
    ASSERT_TRUE(result.has_value());

    const auto& chunks = result.value();
    ASSERT_EQ(chunks.size(), 3u);
    EXPECT_EQ(chunks[0].size(), mib);
    EXPECT_EQ(chunks[1].size(), mib);
    EXPECT_EQ(chunks[2].size(), mib / 2);
    EXPECT_FALSE(chunks[1].is_final);
    EXPECT_TRUE(chunks[2].is_final);
}

TEST_F(ChunkCodecTest, Split_ChunksCarryCRC32) {
    auto data = make_payload(5000);
    auto result = chunk_codec::split(data, 1500, id_);
    ASSERT_TRUE(result.has_value());

    for (const auto& c : result.value()) {
        EXPECT_EQ(c.checksum, checksum::crc32(c.data));
    }
}

TEST_F(ChunkCodecTest, Split_SingleSmallChunkIsFinal) {
    auto data = make_payload(10);
    auto result = chunk_codec::split(data, 1024, id_);
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result.value().size(), 1u);
    EXPECT_TRUE(result.value()[0].is_final);
    EXPECT_EQ(result.value()[0].size(), 10u);
}

// reassemble Tests

TEST_F(ChunkCodecTest, Reassemble_InOrder) {
    auto data = make_payload(10000);
    auto chunks = chunk_codec::split(data, 1024, id_);
    ASSERT_TRUE(chunks.has_value());

    auto restored = chunk_codec::reassemble(to_map(chunks.value()), chunks.value().size());
    ASSERT_TRUE(restored.has_value());
    EXPECT_EQ(restored.value(), data);
}

TEST_F(ChunkCodecTest, Reassemble_AnyDeliveryOrder) {
    auto data = make_payload(7 * 333 + 5);
    auto split = chunk_codec::split(data, 333, id_);
    ASSERT_TRUE(split.has_value());

    auto chunks = split.value();
    std::mt19937 gen(7);
    for (int round = 0; round < 20; ++round) {
        std::shuffle(chunks.begin(), chunks.end(), gen);

        std::map<uint64_t, byte_buffer> received;
        for (const auto& c : chunks) {
            received.emplace(c.index, c.data);
        }

        auto restored = chunk_codec::reassemble(received, chunks.size());
        ASSERT_TRUE(restored.has_value()) << "round " << round;
        EXPECT_EQ(restored.value(), data) << "round " << round;
    }
}

TEST_F(ChunkCodecTest, Reassemble_MissingIndicesListed) {
    auto data = make_payload(10 * 100);
    auto split = chunk_codec::split(data, 100, id_);
    ASSERT_TRUE(split.has_value());

    auto received = to_map(split.value());
    received.erase(2);
    received.erase(7);
    received.erase(0);

    auto restored = chunk_codec::reassemble(received, 10);
    ASSERT_FALSE(restored.has_value());
    EXPECT_EQ(restored.error().code, error_code::incomplete_transfer);
    EXPECT_NE(restored.error().message.find("0, 2, 7"), std::string::npos)
        << restored.error().message;

    auto missing = chunk_codec::find_missing(received, 10);
    EXPECT_EQ(missing, (std::vector<uint64_t>{0, 2, 7}));
}

TEST_F(ChunkCodecTest, Reassemble_MissingTrailingChunk) {
    auto data = make_payload(350);
    auto split = chunk_codec::split(data, 100, id_);
    ASSERT_TRUE(split.has_value());

    auto received = to_map(split.value());
    received.erase(3);

    auto missing = chunk_codec::find_missing(received, 4);
    EXPECT_EQ(missing, (std::vector<uint64_t>{3}));
    EXPECT_FALSE(chunk_codec::reassemble(received, 4).has_value());
}

TEST_F(ChunkCodecTest, Reassemble_IndexBeyondExpectedRejected) {
    std::map<uint64_t, byte_buffer> received;
    received.emplace(0, make_payload(10));
    received.emplace(5, make_payload(10));

    auto restored = chunk_codec::reassemble(received, 2);
    ASSERT_FALSE(restored.has_value());
    EXPECT_EQ(restored.error().code, error_code::invalid_chunk_index);
}

TEST_F(ChunkCodecTest, Reassemble_ZeroChunksIsEmpty) {
    std::map<uint64_t, byte_buffer> received;
    auto restored = chunk_codec::reassemble(received, 0);
    ASSERT_TRUE(restored.has_value());
    EXPECT_TRUE(restored.value().empty());
}

TEST_F(ChunkCodecTest, FormatIndices) {
    EXPECT_EQ(chunk_codec::format_indices({}), "");
    EXPECT_EQ(chunk_codec::format_indices({4}), "4");
    EXPECT_EQ(chunk_codec::format_indices({1, 3, 9}), "1, 3, 9");
}

TEST_F(ChunkCodecTest, MakeChunk_FinalFlag) {
    auto c = chunk_codec::make_chunk(id_, 2, 3, make_payload(16));
    EXPECT_TRUE(c.is_final);
    EXPECT_EQ(c.checksum, checksum::crc32(c.data));

    auto middle = chunk_codec::make_chunk(id_, 1, 3, make_payload(16));
    EXPECT_FALSE(middle.is_final);
}

}  // namespace kcenon::p2p_convert::test
