#include <gtest/gtest.h>
#include <limits>
#include "../../Src/HuffmanSerializer/HuffmanSerializer.hpp"
#include "helpers/unitTestHelpers.hpp"

using namespace huffpack;

class HuffmanSerializerTest : public ::testing::Test
{
protected:
    const std::string MockInputString = "aaabbc";

    // magic, version, count, then (symbol, u64 frequency) entries
    const std::vector<uint8_t> MockContainer = {
        'H', 'U', 'F', 'P',
        0x01,
        0x00, 0x03,
        'a', 0, 0, 0, 0, 0, 0, 0, 3,
        'b', 0, 0, 0, 0, 0, 0, 0, 2,
        'c', 0, 0, 0, 0, 0, 0, 0, 1,
        0x07, 0x1F, 0x00
    };

    // offset of the low byte of the frequency of the n-th entry
    static size_t frequencyLowByte(size_t entry)
    {
        return 7 + entry * 9 + 8;
    }
};

TEST_F(HuffmanSerializerTest, SerializeWritesFrequencyTableAndPayload)
{
    Result<std::vector<uint8_t>> blob = serializer::serialize(toBytes(MockInputString));

    ASSERT_TRUE(blob.success()) << blob.getError();
    EXPECT_EQ(blob.getValue(), MockContainer);
}

TEST_F(HuffmanSerializerTest, DeserializeRebuildsTable)
{
    Result<std::vector<uint8_t>> decoded = serializer::deserialize(MockContainer);

    ASSERT_TRUE(decoded.success()) << decoded.getError();
    EXPECT_EQ(toText(decoded.getValue()), MockInputString);
}

TEST_F(HuffmanSerializerTest, RoundTrip_RandomBytes)
{
    const std::vector<uint8_t> input = genRandomByteInput(20000);

    std::vector<uint8_t> blob = serializer::serialize(input).getValue();
    Result<std::vector<uint8_t>> decoded = serializer::deserialize(blob);

    ASSERT_TRUE(decoded.success()) << decoded.getError();
    EXPECT_EQ(decoded.getValue(), input);
}

TEST_F(HuffmanSerializerTest, EmptyInput)
{
    std::vector<uint8_t> blob = serializer::serialize({}).getValue();
    EXPECT_EQ(blob, (std::vector<uint8_t>{'H', 'U', 'F', 'P', 0x01, 0x00, 0x00, 0x00}));

    Result<std::vector<uint8_t>> decoded = serializer::deserialize(blob);
    ASSERT_TRUE(decoded.success()) << decoded.getError();
    EXPECT_TRUE(decoded.getValue().empty());
}

TEST_F(HuffmanSerializerTest, ReadHeader)
{
    Result<serializer::ContainerHeader> header = serializer::readHeader(MockContainer);

    ASSERT_TRUE(header.success()) << header.getError();
    EXPECT_EQ(header.getValue().version, 1);
    EXPECT_EQ(header.getValue().frequencies.size(), 3);
    EXPECT_EQ(header.getValue().frequencies.at('a'), 3);
    EXPECT_EQ(header.getValue().payloadOffset, MockContainer.size() - 3);
}

TEST_F(HuffmanSerializerTest, BadMagic)
{
    std::vector<uint8_t> blob = MockContainer;
    blob[0] = 'X';

    Result<std::vector<uint8_t>> decoded = serializer::deserialize(blob);
    EXPECT_EQ(decoded.getErrorKind(), ErrorKind::INVALID_CONTAINER);
}

TEST_F(HuffmanSerializerTest, UnsupportedVersion)
{
    std::vector<uint8_t> blob = MockContainer;
    blob[4] = 0x02;

    EXPECT_EQ(serializer::deserialize(blob).getErrorKind(), ErrorKind::INVALID_CONTAINER);
}

TEST_F(HuffmanSerializerTest, TruncatedHeader)
{
    std::vector<uint8_t> tooShort(MockContainer.begin(), MockContainer.begin() + 5);
    EXPECT_EQ(serializer::deserialize(tooShort).getErrorKind(), ErrorKind::INVALID_CONTAINER);

    std::vector<uint8_t> partialTable(MockContainer.begin(), MockContainer.begin() + 20);
    EXPECT_EQ(serializer::deserialize(partialTable).getErrorKind(), ErrorKind::INVALID_CONTAINER);
}

TEST_F(HuffmanSerializerTest, ZeroFrequencyEntry)
{
    std::vector<uint8_t> blob = MockContainer;
    blob[frequencyLowByte(2)] = 0;

    EXPECT_EQ(serializer::deserialize(blob).getErrorKind(), ErrorKind::INVALID_CONTAINER);
}

TEST_F(HuffmanSerializerTest, UnorderedEntries)
{
    std::vector<uint8_t> blob = MockContainer;
    blob[7 + 9] = 'a';  // second entry repeats 'a'

    EXPECT_EQ(serializer::deserialize(blob).getErrorKind(), ErrorKind::INVALID_CONTAINER);
}

TEST_F(HuffmanSerializerTest, FrequencyTotalOverflow)
{
    // a = 2^64 - 1 and b = 2 wrap to a total of 1, which "\x07\x00" would satisfy
    const std::vector<uint8_t> blob = {
        'H', 'U', 'F', 'P',
        0x01,
        0x00, 0x02,
        'a', 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
        'b', 0, 0, 0, 0, 0, 0, 0, 2,
        0x07, 0x00
    };

    Result<serializer::ContainerHeader> header = serializer::readHeader(blob);
    EXPECT_FALSE(header.success());
    EXPECT_EQ(header.getErrorKind(), ErrorKind::INVALID_CONTAINER);
    EXPECT_EQ(serializer::deserialize(blob).getErrorKind(), ErrorKind::INVALID_CONTAINER);
}

TEST_F(HuffmanSerializerTest, LargestFrequencyAlone_IsAccepted)
{
    std::vector<uint8_t> blob = {
        'H', 'U', 'F', 'P',
        0x01,
        0x00, 0x01,
        'a', 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF
    };

    Result<serializer::ContainerHeader> header = serializer::readHeader(blob);
    ASSERT_TRUE(header.success()) << header.getError();
    EXPECT_EQ(header.getValue().frequencies.at('a'), std::numeric_limits<uint64_t>::max());
}

TEST_F(HuffmanSerializerTest, SymbolCountMismatch)
{
    // b:3 still decodes the payload ("bbbaac") but to 6 symbols instead of 7
    std::vector<uint8_t> blob = MockContainer;
    blob[frequencyLowByte(1)] = 3;

    Result<std::vector<uint8_t>> decoded = serializer::deserialize(blob);
    EXPECT_FALSE(decoded.success());
    EXPECT_EQ(decoded.getErrorKind(), ErrorKind::TRUNCATED_OR_CORRUPT_PAYLOAD);
}

TEST_F(HuffmanSerializerTest, MissingPayload)
{
    std::vector<uint8_t> blob(MockContainer.begin(), MockContainer.end() - 3);

    EXPECT_EQ(serializer::deserialize(blob).getErrorKind(), ErrorKind::TRUNCATED_OR_CORRUPT_PAYLOAD);
}
