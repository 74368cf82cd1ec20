#include "codec.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

using namespace snowgen;

class CodecTest : public ::testing::Test {
protected:
    void SetUp() override { }
    void TearDown() override { }

    static constexpr std::int64_t twitter_epoch = 1288834974657;
};

// https://en.wikipedia.org/wiki/Snowflake_ID#Example
TEST_F(CodecTest, DecodesWikipediaExample)
{
    auto decoded = codec::decode(1888944671579078978ULL, twitter_epoch);

    EXPECT_EQ(decoded.timestamp, 1739194479256);
    EXPECT_EQ(decoded.node_id, 360);
    EXPECT_EQ(decoded.sequence, 322);
}

TEST_F(CodecTest, EncodesWikipediaExample)
{
    EXPECT_EQ(codec::encode(1739194479256 - twitter_epoch, 360, 322), 1888944671579078978ULL);
}

TEST_F(CodecTest, EncodePlacesFieldsAtLayoutOffsets)
{
    EXPECT_EQ(codec::encode(1, 0, 0), 1ULL << 22);
    EXPECT_EQ(codec::encode(0, 1, 0), 1ULL << 12);
    EXPECT_EQ(codec::encode(0, 0, 1), 1ULL);
    EXPECT_EQ(codec::encode(0, 0, 0), 0ULL);
}

TEST_F(CodecTest, EncodeAllFieldsAtMaximumLeavesTopBitClear)
{
    auto id = codec::encode(codec::max_timestamp, codec::max_node_id, codec::max_sequence);
    EXPECT_EQ(id, 0x7FFFFFFFFFFFFFFFULL);
}

TEST_F(CodecTest, DecodeRecoversEncodedFields)
{
    const struct {
        std::int64_t elapsed;
        std::uint16_t node_id;
        std::uint16_t sequence;
    } cases[] = {
        {0, 0, 0},
        {0, 1023, 4095},
        {codec::max_timestamp, 0, 0},
        {codec::max_timestamp, 1023, 4095},
        {450359504599, 360, 322},
        {1, 512, 2048},
    };

    for (const auto &c: cases) {
        auto decoded = codec::decode(codec::encode(c.elapsed, c.node_id, c.sequence), twitter_epoch);
        EXPECT_EQ(decoded, (codec::decoded_id{twitter_epoch + c.elapsed, c.node_id, c.sequence}))
            << "elapsed=" << c.elapsed << " node_id=" << c.node_id << " sequence=" << c.sequence;
    }
}

TEST_F(CodecTest, DecodeUsesSuppliedEpoch)
{
    auto id = codec::encode(1000, 7, 9);

    EXPECT_EQ(codec::decode(id, 0).timestamp, 1000);
    EXPECT_EQ(codec::decode(id, 1609459200000).timestamp, 1609459201000);
}

TEST_F(CodecTest, DecodeIgnoresTopBit)
{
    auto id = codec::encode(42, 3, 4) | (1ULL << 63);
    auto decoded = codec::decode(id, 0);

    EXPECT_EQ(decoded.timestamp, 42);
    EXPECT_EQ(decoded.node_id, 3);
    EXPECT_EQ(decoded.sequence, 4);
}

TEST_F(CodecTest, EncodedValuesOrderByTimestampThenSequence)
{
    EXPECT_LT(codec::encode(10, 5, 0), codec::encode(10, 5, 1));
    EXPECT_LT(codec::encode(10, 5, 4095), codec::encode(11, 5, 0));
    EXPECT_LT(codec::encode(10, 1023, 4095), codec::encode(11, 0, 0));
}

TEST_F(CodecTest, EncodeRejectsOutOfRangeFields)
{
    EXPECT_THROW(codec::encode(-1, 0, 0), std::invalid_argument);
    EXPECT_THROW(codec::encode(codec::max_timestamp + 1, 0, 0), std::invalid_argument);
    EXPECT_THROW(codec::encode(0, 1024, 0), std::invalid_argument);
    EXPECT_THROW(codec::encode(0, 0, 4096), std::invalid_argument);
}
