#include "symmorph/crypto/SymmetricMorph.hpp"

#include "symmorph/crypto/AuthTag.hpp"
#include "symmorph/crypto/KeyDerivation.hpp"
#include "symmorph/crypto/MorphEngine.hpp"
#include "symmorph/crypto/entropy/ClockEntropyFactory.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace symmorph::crypto
{
namespace
{

[[nodiscard]] SymmetricMorph::EntropyPtr orClock(SymmetricMorph::EntropyPtr entropy)
{
    if (entropy)
    {
        return entropy;
    }
    return symmorph::crypto::entropy::makeClockEntropySource();
}

} // namespace

SymmetricMorph::SymmetricMorph(symmorph::security::SecureBuffer key, EntropyPtr entropy)
    : m_key{ std::move(key) }, m_entropy{ orClock(std::move(entropy)) }
{
    if (m_key.empty())
    {
        throw std::invalid_argument("SymmetricMorph: empty key");
    }
}

[[nodiscard]] PasswordCipher SymmetricMorph::fromPassword(std::span<const std::byte> password, KdfParams params,
                                                          EntropyPtr entropy)
{
    entropy = orClock(std::move(entropy));
    auto salt{ entropy->salt(g_kDefaultSaltBytes) };
    auto key{ deriveKey(password, symmorph::security::asSpan(salt), params) };
    return PasswordCipher{ .cipher = SymmetricMorph{ std::move(key), std::move(entropy) }, .salt = std::move(salt) };
}

[[nodiscard]] SymmetricMorph SymmetricMorph::fromPasswordWithSalt(std::span<const std::byte> password,
                                                                  std::span<const std::uint8_t> salt, KdfParams params,
                                                                  EntropyPtr entropy)
{
    return SymmetricMorph{ deriveKey(password, salt, params), std::move(entropy) };
}

[[nodiscard]] SymmetricMorph SymmetricMorph::fromKey(std::span<const std::uint8_t> key, EntropyPtr entropy)
{
    return SymmetricMorph{ symmorph::security::secureBufferFrom(key), std::move(entropy) };
}

[[nodiscard]] symmorph::security::SecureBuffer SymmetricMorph::generateKey(std::size_t length, EntropyPtr entropy)
{
    return orClock(std::move(entropy))->key(length);
}

[[nodiscard]] std::vector<std::uint8_t> SymmetricMorph::encrypt(std::span<const std::uint8_t> plain) const
{
    return encryptWithNonce(plain, m_entropy->nonce());
}

[[nodiscard]] std::vector<std::uint8_t> SymmetricMorph::encryptWithNonce(std::span<const std::uint8_t> plain,
                                                                         const Nonce& nonce) const
{
    auto record{ makeRecordBuffer(nonce, plain.size()) };
    const auto payload{ std::span<std::uint8_t>{ record }.subspan(g_kRecordHeaderBytes) };

    MorphEngine engine{ symmorph::security::asSpan(m_key), nonce };
    engine.encrypt(plain, payload);

    writeRecordTag(std::span<std::uint8_t>{ record },
                   computeAuthTag(engine.macAccumulator(), symmorph::security::asSpan(m_key)));
    return record;
}

[[nodiscard]] CipherResult<symmorph::security::SecureBuffer>
SymmetricMorph::decrypt(std::span<const std::uint8_t> record) const
{
    const auto view{ parseRecord(record) };
    if (!view)
    {
        return CipherError::MalformedRecord;
    }

    Nonce nonce{};
    std::copy(view->nonce.begin(), view->nonce.end(), nonce.begin());

    symmorph::security::SecureBuffer plain{};
    plain.resize(view->payload.size());

    MorphEngine engine{ symmorph::security::asSpan(m_key), nonce };
    engine.decrypt(view->payload, std::span<std::uint8_t>{ plain });

    const auto expected{ computeAuthTag(engine.macAccumulator(), symmorph::security::asSpan(m_key)) };
    if (!verifyAuthTag(expected, view->tag))
    {
        symmorph::security::secureRelease(plain);
        return CipherError::IntegrityFailure;
    }
    return plain;
}

[[nodiscard]] std::vector<std::vector<std::uint8_t>>
SymmetricMorph::encryptChunks(std::span<const std::vector<std::uint8_t>> chunks) const
{
    std::vector<std::vector<std::uint8_t>> out{};
    out.reserve(chunks.size());
    for (const auto& chunk : chunks)
    {
        out.push_back(encrypt(chunk));
    }
    return out;
}

[[nodiscard]] std::vector<CipherResult<symmorph::security::SecureBuffer>>
SymmetricMorph::decryptChunks(std::span<const std::vector<std::uint8_t>> records) const
{
    std::vector<CipherResult<symmorph::security::SecureBuffer>> out{};
    out.reserve(records.size());
    for (const auto& record : records)
    {
        out.push_back(decrypt(record));
    }
    return out;
}

[[nodiscard]] const char* describe(CipherError error) noexcept
{
    switch (error)
    {
    case CipherError::MalformedRecord:
        return "record is shorter than the nonce and tag header";
    case CipherError::IntegrityFailure:
        return "MAC verification failed (integrity broken)";
    }
    return "unknown cipher error";
}

} // namespace symmorph::crypto
