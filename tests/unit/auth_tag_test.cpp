#include <gtest/gtest.h>

#include <array>
#include <cstdint>
#include <stdexcept>

#include "TestUtils.hpp"
#include "symmorph/crypto/AuthTag.hpp"
#include "symmorph/crypto/CipherRecord.hpp"

TEST(AuthTag, MatchesKnownAnswer)
{
    constexpr std::array<std::uint8_t, 3> kKey{ 0x01U, 0x02U, 0x03U };
    const auto tag{ symmorph::crypto::computeAuthTag(0x5AU, kKey) };

    EXPECT_EQ(symmorph::test_utils::toHex(tag), "5b4b7f62140629ddc1f0e688bfaf5346681a0d3125d4faec9383b75a4c7e6115");
}

TEST(AuthTag, RejectsEmptyKey)
{
    EXPECT_THROW((void)symmorph::crypto::computeAuthTag(0U, std::span<const std::uint8_t>{}), std::invalid_argument);
}

TEST(AuthTag, DifferentAccumulatorsGiveDifferentTags)
{
    constexpr std::array<std::uint8_t, 2> kKey{ 0xAAU, 0x55U };
    EXPECT_NE(symmorph::crypto::computeAuthTag(1U, kKey), symmorph::crypto::computeAuthTag(2U, kKey));
}

TEST(AuthTag, VerifyComparesWholeTag)
{
    constexpr std::array<std::uint8_t, 2> kKey{ 0xAAU, 0x55U };
    const auto tag{ symmorph::crypto::computeAuthTag(0x33U, kKey) };
    auto altered{ tag };
    altered.back() ^= 0x80U;

    EXPECT_TRUE(symmorph::crypto::verifyAuthTag(tag, tag));
    EXPECT_FALSE(symmorph::crypto::verifyAuthTag(tag, altered));
    EXPECT_FALSE(symmorph::crypto::verifyAuthTag(tag, std::span{ tag }.first(31U)));
}

TEST(CipherRecord, ParseRejectsShortInput)
{
    const std::vector<std::uint8_t> tooShort(symmorph::crypto::g_kRecordHeaderBytes - 1U);
    EXPECT_FALSE(symmorph::crypto::parseRecord(tooShort).has_value());
    EXPECT_FALSE(symmorph::crypto::parseRecord({}).has_value());
}

TEST(CipherRecord, LayoutIsNonceTagPayload)
{
    const symmorph::crypto::Nonce nonce{ 1U, 2U, 3U, 4U, 5U, 6U, 7U, 8U };
    auto record{ symmorph::crypto::makeRecordBuffer(nonce, 3U) };
    ASSERT_EQ(record.size(), symmorph::crypto::g_kRecordHeaderBytes + 3U);

    symmorph::crypto::AuthTag tag{};
    tag.fill(0xEEU);
    symmorph::crypto::writeRecordTag(record, tag);
    record[40] = 0xA1U;
    record[42] = 0xA3U;

    const auto view{ symmorph::crypto::parseRecord(record) };
    ASSERT_TRUE(view.has_value());
    EXPECT_EQ(symmorph::test_utils::toHex(view->nonce), "0102030405060708");
    EXPECT_EQ(view->tag[0], 0xEEU);
    EXPECT_EQ(view->tag[31], 0xEEU);
    ASSERT_EQ(view->payload.size(), 3U);
    EXPECT_EQ(view->payload[0], 0xA1U);
    EXPECT_EQ(view->payload[2], 0xA3U);
}

TEST(CipherRecord, HeaderOnlyRecordHasEmptyPayload)
{
    const std::vector<std::uint8_t> record(symmorph::crypto::g_kRecordHeaderBytes, 0x00U);
    const auto view{ symmorph::crypto::parseRecord(record) };
    ASSERT_TRUE(view.has_value());
    EXPECT_TRUE(view->payload.empty());
}
