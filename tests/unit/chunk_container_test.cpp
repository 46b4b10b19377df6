#include <gtest/gtest.h>

#include <cstdint>
#include <vector>

#include "TestUtils.hpp"
#include "symmorph/core/ChunkContainer.hpp"

namespace
{

[[nodiscard]] symmorph::core::ChunkContainer sampleContainer()
{
    symmorph::core::ChunkContainer c{};
    c.header.keyMode = symmorph::core::KeyMode::Password;
    c.header.iterations = 20000U;
    c.header.keyBytes = 64U;
    c.header.salt = { 0xAAU, 0xBBU, 0xCCU };
    c.header.chunkBytes = 4096U;
    c.records.emplace_back(40U, 0x11U);
    c.records.emplace_back(45U, 0x22U);
    return c;
}

} // namespace

TEST(ChunkContainer, EncodesLittleEndianLayout)
{
    const auto bytes{ symmorph::core::encodeChunkContainer(sampleContainer()) };

    // magic, version 1, key mode 1, 20000 rounds, 64 key bytes, salt length 3
    EXPECT_EQ(symmorph::test_utils::toHex(std::span{ bytes }.first(27U)),
              "534d4331"
              "01000000"
              "01000000"
              "204e0000"
              "40000000"
              "03000000"
              "aabbcc");
    // chunk size 4096, two records, first record length 40
    EXPECT_EQ(symmorph::test_utils::toHex(std::span{ bytes }.subspan(27U, 12U)), "001000000200000028000000");
    EXPECT_EQ(bytes.size(), 27U + 8U + 4U + 40U + 4U + 45U);
}

TEST(ChunkContainer, DecodeRestoresEverything)
{
    const auto original{ sampleContainer() };
    const auto decoded{ symmorph::core::decodeChunkContainer(symmorph::core::encodeChunkContainer(original)) };

    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->header.version, symmorph::core::g_kContainerVersionCurrent);
    EXPECT_EQ(decoded->header.keyMode, symmorph::core::KeyMode::Password);
    EXPECT_EQ(decoded->header.iterations, 20000U);
    EXPECT_EQ(decoded->header.keyBytes, 64U);
    EXPECT_EQ(decoded->header.salt, original.header.salt);
    EXPECT_EQ(decoded->header.chunkBytes, 4096U);
    EXPECT_EQ(decoded->records, original.records);
}

TEST(ChunkContainer, RawKeyContainerWithoutChunks)
{
    symmorph::core::ChunkContainer c{};
    c.header.keyMode = symmorph::core::KeyMode::RawKey;
    c.header.chunkBytes = 1U;

    const auto decoded{ symmorph::core::decodeChunkContainer(symmorph::core::encodeChunkContainer(c)) };
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->header.keyMode, symmorph::core::KeyMode::RawKey);
    EXPECT_TRUE(decoded->header.salt.empty());
    EXPECT_TRUE(decoded->records.empty());
}

TEST(ChunkContainer, RejectsBadMagicVersionAndKeyMode)
{
    const auto good{ symmorph::core::encodeChunkContainer(sampleContainer()) };

    auto badMagic{ good };
    badMagic[3] = '2';
    EXPECT_FALSE(symmorph::core::decodeChunkContainer(badMagic).has_value());

    auto badVersion{ good };
    badVersion[4] = 2U;
    EXPECT_FALSE(symmorph::core::decodeChunkContainer(badVersion).has_value());

    auto badMode{ good };
    badMode[8] = 3U;
    EXPECT_FALSE(symmorph::core::decodeChunkContainer(badMode).has_value());
}

TEST(ChunkContainer, RejectsTruncationAtEveryLength)
{
    const auto good{ symmorph::core::encodeChunkContainer(sampleContainer()) };
    for (std::size_t n{}; n < good.size(); ++n)
    {
        EXPECT_FALSE(symmorph::core::decodeChunkContainer(std::span{ good }.first(n)).has_value()) << n;
    }
}

TEST(ChunkContainer, RejectsTrailingBytes)
{
    auto bytes{ symmorph::core::encodeChunkContainer(sampleContainer()) };
    bytes.push_back(0x00U);
    EXPECT_FALSE(symmorph::core::decodeChunkContainer(bytes).has_value());
}

TEST(ChunkContainer, RejectsRecordShorterThanHeader)
{
    auto c{ sampleContainer() };
    c.records[1].resize(39U);
    EXPECT_FALSE(
        symmorph::core::decodeChunkContainer(symmorph::core::encodeChunkContainer(c)).has_value());
}

TEST(ChunkContainer, RejectsImplausibleChunkCount)
{
    auto bytes{ symmorph::core::encodeChunkContainer(sampleContainer()) };
    // chunkCount sits right after the chunk size field.
    bytes[31] = 0xFFU;
    bytes[32] = 0xFFU;
    bytes[33] = 0xFFU;
    bytes[34] = 0x7FU;
    EXPECT_FALSE(symmorph::core::decodeChunkContainer(bytes).has_value());
}
