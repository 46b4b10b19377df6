#include "FileCommands.hpp"

#include "Hex.hpp"
#include "symmorph/core/ChunkContainer.hpp"
#include "symmorph/core/ChunkPipeline.hpp"
#include "symmorph/security/ScopeWipe.hpp"

#include <fstream>
#include <iterator>
#include <limits>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <system_error>
#include <variant>

namespace symmorph::ui::cli
{
namespace
{

[[nodiscard]] std::optional<std::vector<std::uint8_t>> readFile(const std::filesystem::path& path)
{
    std::ifstream in{ path, std::ios::binary };
    if (!in)
    {
        return std::nullopt;
    }
    std::vector<std::uint8_t> data{ std::istreambuf_iterator<char>{ in }, std::istreambuf_iterator<char>{} };
    if (in.bad())
    {
        return std::nullopt;
    }
    return data;
}

// Writes to a sibling temp file first so a failed run never leaves a truncated output behind.
[[nodiscard]] bool writeFile(const std::filesystem::path& path, std::span<const std::uint8_t> data)
{
    std::filesystem::path tmp{ path };
    tmp += ".tmp";
    {
        std::ofstream out{ tmp, std::ios::binary | std::ios::trunc };
        if (!out)
        {
            return false;
        }
        out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        if (!out.flush())
        {
            std::error_code ec{};
            std::filesystem::remove(tmp, ec);
            return false;
        }
    }

    std::error_code ec{};
    std::filesystem::rename(tmp, path, ec);
    if (ec)
    {
        std::error_code ignored{};
        std::filesystem::remove(tmp, ignored);
        return false;
    }
    return true;
}

[[nodiscard]] bool validKeySelection(const KeyOptions& key, std::ostream& err)
{
    if (key.usePassword == !key.keyHex.empty())
    {
        err << "Error: Choose exactly one of --password or --key-hex.\n";
        return false;
    }
    return true;
}

[[nodiscard]] std::optional<symmorph::security::SecureBuffer> parseKeyHex(const std::string& keyHex,
                                                                          std::ostream& err)
{
    auto key{ parseHex(keyHex) };
    if (!key || key->empty())
    {
        err << "Error: --key-hex must be a non-empty even-length hex string.\n";
        return std::nullopt;
    }
    return key;
}

[[nodiscard]] std::optional<symmorph::security::SecureString> promptPassword(const PasswordReader& readPassword,
                                                                             bool confirm, std::ostream& err)
{
    auto first{ readPassword("Password: ") };
    if (first.empty())
    {
        symmorph::security::secureRelease(first);
        err << "Error: Empty password.\n";
        return std::nullopt;
    }
    if (confirm)
    {
        auto second{ readPassword("Confirm Password: ") };
        auto wipeSecond{ symmorph::security::scopeWipe(second) };
        if (symmorph::security::asStringView(first) != symmorph::security::asStringView(second))
        {
            symmorph::security::secureRelease(first);
            err << "Error: Passwords do not match.\n";
            return std::nullopt;
        }
    }
    return first;
}

} // namespace

[[nodiscard]] int runKeygen(std::size_t length, const symmorph::crypto::SymmetricMorph::EntropyPtr& entropy,
                            std::ostream& out, std::ostream& err)
{
    if (length == 0U || length > symmorph::crypto::g_kMaxKeyBytes)
    {
        err << "Error: Key length must be between 1 and " << symmorph::crypto::g_kMaxKeyBytes << ".\n";
        return g_kExitUsage;
    }

    auto key{ symmorph::crypto::SymmetricMorph::generateKey(length, entropy) };
    auto wipeKey{ symmorph::security::scopeWipe(key) };
    out << toHex(symmorph::security::asSpan(key)) << "\n";
    return g_kExitOk;
}

[[nodiscard]] int runEncryptFile(const EncryptFileOptions& options, const PasswordReader& readPassword,
                                 const symmorph::crypto::SymmetricMorph::EntropyPtr& entropy, std::ostream& err)
{
    if (!validKeySelection(options.key, err))
    {
        return g_kExitUsage;
    }
    if (options.chunkBytes == 0U || options.chunkBytes > std::numeric_limits<std::uint32_t>::max())
    {
        err << "Error: Invalid chunk size.\n";
        return g_kExitUsage;
    }
    if (options.keyBytes > std::numeric_limits<std::uint32_t>::max())
    {
        err << "Error: Invalid key length.\n";
        return g_kExitUsage;
    }

    auto plain{ readFile(options.input) };
    if (!plain)
    {
        err << "Error: Cannot read " << options.input.string() << "\n";
        return g_kExitUsage;
    }
    auto wipePlain{ symmorph::security::scopeWipe(std::span<std::uint8_t>{ *plain }) };

    symmorph::core::ChunkContainer container{};
    container.header.chunkBytes = static_cast<std::uint32_t>(options.chunkBytes);

    std::optional<symmorph::crypto::SymmetricMorph> cipher{};
    if (options.key.usePassword)
    {
        auto password{ promptPassword(readPassword, true, err) };
        if (!password)
        {
            return g_kExitUsage;
        }
        auto wipePassword{ symmorph::security::scopeWipe(*password) };

        const symmorph::crypto::KdfParams params{ .iterations = options.iterations, .keyBytes = options.keyBytes };
        std::optional<symmorph::crypto::PasswordCipher> derivedOpt{};
        try
        {
            derivedOpt.emplace(
                symmorph::crypto::SymmetricMorph::fromPassword(symmorph::security::asBytes(*password), params, entropy));
        }
        catch (const std::invalid_argument& e)
        {
            err << "Error: Invalid key derivation parameters (" << e.what() << ").\n";
            return g_kExitUsage;
        }
        auto& derived{ *derivedOpt };
        container.header.keyMode = symmorph::core::KeyMode::Password;
        container.header.iterations = params.iterations;
        container.header.keyBytes = static_cast<std::uint32_t>(params.keyBytes);
        container.header.salt.assign(derived.salt.begin(), derived.salt.end());
        cipher.emplace(std::move(derived.cipher));
    }
    else
    {
        auto key{ parseKeyHex(options.key.keyHex, err) };
        if (!key)
        {
            return g_kExitUsage;
        }
        container.header.keyMode = symmorph::core::KeyMode::RawKey;
        cipher.emplace(symmorph::crypto::SymmetricMorph::fromKey(symmorph::security::asSpan(*key), entropy));
    }

    const auto chunks{ symmorph::core::splitIntoChunks(*plain, options.chunkBytes) };
    const symmorph::core::ChunkPipeline pipeline{ *cipher, options.jobs };
    container.records = pipeline.encryptAll(chunks);

    const auto encoded{ symmorph::core::encodeChunkContainer(container) };
    if (!writeFile(options.output, encoded))
    {
        err << "Error: Cannot write " << options.output.string() << "\n";
        return g_kExitUsage;
    }
    return g_kExitOk;
}

[[nodiscard]] int runDecryptFile(const DecryptFileOptions& options, const PasswordReader& readPassword,
                                 std::ostream& err)
{
    if (!validKeySelection(options.key, err))
    {
        return g_kExitUsage;
    }

    const auto bytes{ readFile(options.input) };
    if (!bytes)
    {
        err << "Error: Cannot read " << options.input.string() << "\n";
        return g_kExitUsage;
    }

    const auto container{ symmorph::core::decodeChunkContainer(*bytes) };
    if (!container)
    {
        err << "Error: " << options.input.string() << " is not a symmorph container.\n";
        return g_kExitRejected;
    }
    const auto& header{ container->header };

    std::optional<symmorph::crypto::SymmetricMorph> cipher{};
    if (header.keyMode == symmorph::core::KeyMode::Password)
    {
        if (!options.key.usePassword)
        {
            err << "Error: This container was written with a password; use --password.\n";
            return g_kExitUsage;
        }
        auto password{ promptPassword(readPassword, false, err) };
        if (!password)
        {
            return g_kExitUsage;
        }
        auto wipePassword{ symmorph::security::scopeWipe(*password) };

        const symmorph::crypto::KdfParams params{ .iterations = header.iterations, .keyBytes = header.keyBytes };
        try
        {
            cipher.emplace(symmorph::crypto::SymmetricMorph::fromPasswordWithSalt(
                symmorph::security::asBytes(*password), header.salt, params));
        }
        catch (const std::invalid_argument& e)
        {
            err << "Error: Unsupported key derivation parameters (" << e.what() << ").\n";
            return g_kExitRejected;
        }
    }
    else
    {
        if (options.key.keyHex.empty())
        {
            err << "Error: This container was written with a raw key; use --key-hex.\n";
            return g_kExitUsage;
        }
        auto key{ parseKeyHex(options.key.keyHex, err) };
        if (!key)
        {
            return g_kExitUsage;
        }
        cipher.emplace(symmorph::crypto::SymmetricMorph::fromKey(symmorph::security::asSpan(*key)));
    }

    const symmorph::core::ChunkPipeline pipeline{ *cipher, options.jobs };
    auto results{ pipeline.decryptAll(container->records) };

    std::size_t total{ 0U };
    for (const auto& result : results)
    {
        if (const auto* chunk = std::get_if<symmorph::security::SecureBuffer>(&result))
        {
            total += chunk->size();
        }
    }

    symmorph::security::SecureBuffer plain{};
    plain.reserve(total);
    for (std::size_t i{}; i < results.size(); ++i)
    {
        if (const auto* error = std::get_if<symmorph::crypto::CipherError>(&results[i]))
        {
            err << "Error: Chunk " << i << ": " << symmorph::crypto::describe(*error) << "\n";
            return g_kExitRejected;
        }
        auto& chunk{ std::get<symmorph::security::SecureBuffer>(results[i]) };
        plain.insert(plain.end(), chunk.begin(), chunk.end());
        symmorph::security::secureRelease(chunk);
    }

    if (!writeFile(options.output, symmorph::security::asSpan(plain)))
    {
        err << "Error: Cannot write " << options.output.string() << "\n";
        return g_kExitUsage;
    }
    return g_kExitOk;
}

} // namespace symmorph::ui::cli
