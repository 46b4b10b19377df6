#ifndef SYMMORPH_UI_CLI_FILECOMMANDS_HPP
#define SYMMORPH_UI_CLI_FILECOMMANDS_HPP

#include "ConsoleUtils.hpp"
#include "symmorph/crypto/KdfParams.hpp"
#include "symmorph/crypto/SymmetricMorph.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <string>

namespace symmorph::ui::cli
{

constexpr int g_kExitOk{ 0 };
constexpr int g_kExitUsage{ 1 };
constexpr int g_kExitRejected{ 2 };

constexpr std::size_t g_kDefaultChunkBytes{ 64U * 1024U };

// Exactly one of usePassword / keyHex selects the key.
struct KeyOptions final
{
    bool usePassword{ false };
    std::string keyHex;
};

struct EncryptFileOptions final
{
    std::filesystem::path input;
    std::filesystem::path output;
    KeyOptions key;
    std::uint32_t iterations{ symmorph::crypto::g_kDefaultKdfIterations };
    std::size_t keyBytes{ symmorph::crypto::g_kDefaultKeyBytes };
    std::size_t chunkBytes{ g_kDefaultChunkBytes };
    std::size_t jobs{ 1U };
};

struct DecryptFileOptions final
{
    std::filesystem::path input;
    std::filesystem::path output;
    KeyOptions key;
    std::size_t jobs{ 1U };
};

// Each command reports problems on `err` and returns one of the g_kExit* codes.
[[nodiscard]] int runKeygen(std::size_t length, const symmorph::crypto::SymmetricMorph::EntropyPtr& entropy,
                            std::ostream& out, std::ostream& err);

[[nodiscard]] int runEncryptFile(const EncryptFileOptions& options, const PasswordReader& readPassword,
                                 const symmorph::crypto::SymmetricMorph::EntropyPtr& entropy, std::ostream& err);

// Writes nothing unless every chunk authenticates.
[[nodiscard]] int runDecryptFile(const DecryptFileOptions& options, const PasswordReader& readPassword,
                                 std::ostream& err);

} // namespace symmorph::ui::cli

#endif // SYMMORPH_UI_CLI_FILECOMMANDS_HPP
