#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "FileCommands.hpp"
#include "Hex.hpp"
#include "TestUtils.hpp"
#include "symmorph/core/ChunkContainer.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

using ::testing::HasSubstr;
using namespace symmorph::ui::cli;

namespace
{

[[nodiscard]] std::vector<std::uint8_t> slurp(const fs::path& p)
{
    std::ifstream in{ p, std::ios::binary };
    return { std::istreambuf_iterator<char>{ in }, std::istreambuf_iterator<char>{} };
}

void spit(const fs::path& p, std::string_view text)
{
    std::ofstream out{ p, std::ios::binary | std::ios::trunc };
    out.write(text.data(), static_cast<std::streamsize>(text.size()));
}

[[nodiscard]] PasswordReader fixedPassword(std::string value)
{
    return [value = std::move(value)](const std::string&) { return symmorph::security::secureStringFrom(value); };
}

constexpr std::string_view g_kRawKeyHex{ "000102030405060708090a0b0c0d0e0f" };

class FileCommandsTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_FALSE(m_dir.path().empty());
        m_plain = m_dir.path() / "plain.txt";
        m_sealed = m_dir.path() / "plain.smc";
        m_restored = m_dir.path() / "restored.txt";

        std::string text;
        for (int i{}; i < 500; ++i)
        {
            text += "line " + std::to_string(i) + " of the sample document\n";
        }
        m_text = text;
        spit(m_plain, m_text);
    }

    [[nodiscard]] EncryptFileOptions encryptOptions() const
    {
        EncryptFileOptions opts{};
        opts.input = m_plain;
        opts.output = m_sealed;
        opts.iterations = 100U;
        opts.chunkBytes = 1024U;
        opts.jobs = 4U;
        return opts;
    }

    [[nodiscard]] DecryptFileOptions decryptOptions() const
    {
        DecryptFileOptions opts{};
        opts.input = m_sealed;
        opts.output = m_restored;
        opts.jobs = 2U;
        return opts;
    }

    symmorph::test_utils::TempDir m_dir{ "file_commands_" }; // NOLINT
    fs::path m_plain;                                         // NOLINT
    fs::path m_sealed;                                        // NOLINT
    fs::path m_restored;                                      // NOLINT
    std::string m_text;                                       // NOLINT
    std::ostringstream m_err;                                 // NOLINT
};

} // namespace

TEST_F(FileCommandsTest, PasswordRoundTrip)
{
    auto enc{ encryptOptions() };
    enc.key.usePassword = true;
    ASSERT_EQ(runEncryptFile(enc, fixedPassword("StrongPassword123"), nullptr, m_err), g_kExitOk) << m_err.str();

    const auto container{ symmorph::core::decodeChunkContainer(slurp(m_sealed)) };
    ASSERT_TRUE(container.has_value());
    EXPECT_EQ(container->header.keyMode, symmorph::core::KeyMode::Password);
    EXPECT_EQ(container->header.iterations, 100U);
    EXPECT_EQ(container->header.salt.size(), symmorph::crypto::g_kDefaultSaltBytes);
    EXPECT_EQ(container->records.size(), (m_text.size() + 1023U) / 1024U);

    auto dec{ decryptOptions() };
    dec.key.usePassword = true;
    ASSERT_EQ(runDecryptFile(dec, fixedPassword("StrongPassword123"), m_err), g_kExitOk) << m_err.str();

    const auto restored{ slurp(m_restored) };
    EXPECT_EQ(std::string(restored.begin(), restored.end()), m_text);
    EXPECT_FALSE(fs::exists(fs::path{ m_restored } += ".tmp"));
}

TEST_F(FileCommandsTest, RawKeyRoundTrip)
{
    auto enc{ encryptOptions() };
    enc.key.keyHex = g_kRawKeyHex;
    ASSERT_EQ(runEncryptFile(enc, fixedPassword("unused"), nullptr, m_err), g_kExitOk) << m_err.str();

    auto dec{ decryptOptions() };
    dec.key.keyHex = g_kRawKeyHex;
    ASSERT_EQ(runDecryptFile(dec, fixedPassword("unused"), m_err), g_kExitOk) << m_err.str();

    const auto restored{ slurp(m_restored) };
    EXPECT_EQ(std::string(restored.begin(), restored.end()), m_text);
}

TEST_F(FileCommandsTest, EmptyFileRoundTrips)
{
    spit(m_plain, "");
    auto enc{ encryptOptions() };
    enc.key.keyHex = g_kRawKeyHex;
    ASSERT_EQ(runEncryptFile(enc, fixedPassword("unused"), nullptr, m_err), g_kExitOk);

    auto dec{ decryptOptions() };
    dec.key.keyHex = g_kRawKeyHex;
    ASSERT_EQ(runDecryptFile(dec, fixedPassword("unused"), m_err), g_kExitOk);
    EXPECT_TRUE(slurp(m_restored).empty());
}

TEST_F(FileCommandsTest, WrongPasswordIsRejectedWithoutOutput)
{
    auto enc{ encryptOptions() };
    enc.key.usePassword = true;
    ASSERT_EQ(runEncryptFile(enc, fixedPassword("right"), nullptr, m_err), g_kExitOk);

    auto dec{ decryptOptions() };
    dec.key.usePassword = true;
    EXPECT_EQ(runDecryptFile(dec, fixedPassword("wrong"), m_err), g_kExitRejected);
    EXPECT_THAT(m_err.str(), HasSubstr("Error: Chunk 0: MAC verification failed"));
    EXPECT_FALSE(fs::exists(m_restored));
}

TEST_F(FileCommandsTest, TamperedTagNamesTheChunk)
{
    auto enc{ encryptOptions() };
    enc.key.keyHex = g_kRawKeyHex;
    ASSERT_EQ(runEncryptFile(enc, fixedPassword("unused"), nullptr, m_err), g_kExitOk);

    auto container{ symmorph::core::decodeChunkContainer(slurp(m_sealed)) };
    ASSERT_TRUE(container.has_value());
    ASSERT_GE(container->records.size(), 3U);
    container->records[2][10] ^= 0x01U;
    const auto bytes{ symmorph::core::encodeChunkContainer(*container) };
    spit(m_sealed, std::string_view{ reinterpret_cast<const char*>(bytes.data()), bytes.size() });

    auto dec{ decryptOptions() };
    dec.key.keyHex = g_kRawKeyHex;
    EXPECT_EQ(runDecryptFile(dec, fixedPassword("unused"), m_err), g_kExitRejected);
    EXPECT_THAT(m_err.str(), HasSubstr("Error: Chunk 2:"));
    EXPECT_FALSE(fs::exists(m_restored));
}

TEST_F(FileCommandsTest, NotAContainer)
{
    spit(m_sealed, "plain text, not sealed");
    auto dec{ decryptOptions() };
    dec.key.keyHex = g_kRawKeyHex;
    EXPECT_EQ(runDecryptFile(dec, fixedPassword("unused"), m_err), g_kExitRejected);
    EXPECT_THAT(m_err.str(), HasSubstr("is not a symmorph container"));
}

TEST_F(FileCommandsTest, PasswordConfirmationMustMatch)
{
    int calls{};
    const PasswordReader mismatched{ [&calls](const std::string&)
                                     {
                                         ++calls;
                                         return symmorph::security::secureStringFrom(calls == 1 ? "passA" : "passB");
                                     } };
    auto enc{ encryptOptions() };
    enc.key.usePassword = true;
    EXPECT_EQ(runEncryptFile(enc, mismatched, nullptr, m_err), g_kExitUsage);
    EXPECT_THAT(m_err.str(), HasSubstr("Error: Passwords do not match."));
    EXPECT_EQ(calls, 2);
    EXPECT_FALSE(fs::exists(m_sealed));
}

TEST_F(FileCommandsTest, EmptyPasswordIsRefused)
{
    auto enc{ encryptOptions() };
    enc.key.usePassword = true;
    EXPECT_EQ(runEncryptFile(enc, fixedPassword(""), nullptr, m_err), g_kExitUsage);
    EXPECT_THAT(m_err.str(), HasSubstr("Error: Empty password."));
}

TEST_F(FileCommandsTest, KeySelectionMustBeExclusive)
{
    auto enc{ encryptOptions() };
    EXPECT_EQ(runEncryptFile(enc, fixedPassword("x"), nullptr, m_err), g_kExitUsage);

    enc.key.usePassword = true;
    enc.key.keyHex = g_kRawKeyHex;
    EXPECT_EQ(runEncryptFile(enc, fixedPassword("x"), nullptr, m_err), g_kExitUsage);
    EXPECT_THAT(m_err.str(), HasSubstr("exactly one of --password or --key-hex"));
}

TEST_F(FileCommandsTest, BadKeyHexAndMissingInput)
{
    auto enc{ encryptOptions() };
    enc.key.keyHex = "abc";
    EXPECT_EQ(runEncryptFile(enc, fixedPassword("x"), nullptr, m_err), g_kExitUsage);
    EXPECT_THAT(m_err.str(), HasSubstr("--key-hex must be"));

    enc.key.keyHex = g_kRawKeyHex;
    enc.input = m_dir.path() / "missing.txt";
    EXPECT_EQ(runEncryptFile(enc, fixedPassword("x"), nullptr, m_err), g_kExitUsage);
    EXPECT_THAT(m_err.str(), HasSubstr("Cannot read"));
}

TEST_F(FileCommandsTest, DecryptNeedsMatchingKeyMode)
{
    auto enc{ encryptOptions() };
    enc.key.keyHex = g_kRawKeyHex;
    ASSERT_EQ(runEncryptFile(enc, fixedPassword("unused"), nullptr, m_err), g_kExitOk);

    auto dec{ decryptOptions() };
    dec.key.usePassword = true;
    EXPECT_EQ(runDecryptFile(dec, fixedPassword("x"), m_err), g_kExitUsage);
    EXPECT_THAT(m_err.str(), HasSubstr("written with a raw key"));
}

TEST(KeygenCommand, PrintsHexOfRequestedLength)
{
    std::ostringstream out;
    std::ostringstream err;
    EXPECT_EQ(runKeygen(16U, symmorph::test_utils::fixedClockEntropy(), out, err), g_kExitOk);

    const auto line{ out.str() };
    ASSERT_EQ(line.size(), 33U);
    EXPECT_EQ(line.back(), '\n');
    const auto parsed{ parseHex(std::string_view{ line }.substr(0U, 32U)) };
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, symmorph::crypto::keyFromMillis(symmorph::test_utils::g_kFixedWallMillis, 16U));
}

TEST(KeygenCommand, RejectsZeroLength)
{
    std::ostringstream out;
    std::ostringstream err;
    EXPECT_EQ(runKeygen(0U, nullptr, out, err), g_kExitUsage);
    EXPECT_TRUE(out.str().empty());
}
