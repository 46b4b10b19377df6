#ifndef INCLUDE_SYMMORPH_CRYPTO_SYMMETRICMORPH_HPP
#define INCLUDE_SYMMORPH_CRYPTO_SYMMETRICMORPH_HPP

#include "symmorph/crypto/CipherRecord.hpp"
#include "symmorph/crypto/EntropySource.hpp"
#include "symmorph/crypto/KdfParams.hpp"
#include "symmorph/security/SecureBuffer.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <variant>
#include <vector>

namespace symmorph::crypto
{

enum class CipherError : std::uint8_t
{
    MalformedRecord,
    IntegrityFailure,
};

template <class T> using CipherResult = std::variant<T, CipherError>;

struct PasswordCipher;

// Stream cipher bound to one immutable key. Const member functions keep all per-call state on the stack,
// so a single instance may be shared between threads.
class SymmetricMorph final
{
public:
    using EntropyPtr = std::shared_ptr<const EntropySource>;

    SymmetricMorph(const SymmetricMorph&) = delete;
    SymmetricMorph& operator=(const SymmetricMorph&) = delete;
    SymmetricMorph(SymmetricMorph&&) noexcept = default;
    SymmetricMorph& operator=(SymmetricMorph&&) noexcept = default;
    ~SymmetricMorph() = default;

    // Draws a fresh salt from `entropy` (the clock source when null) and derives the key.
    // The returned salt is needed again for fromPasswordWithSalt.
    [[nodiscard]] static PasswordCipher fromPassword(std::span<const std::byte> password,
                                                     KdfParams params = g_kDefaultKdfParams,
                                                     EntropyPtr entropy = nullptr);

    [[nodiscard]] static SymmetricMorph fromPasswordWithSalt(std::span<const std::byte> password,
                                                             std::span<const std::uint8_t> salt,
                                                             KdfParams params = g_kDefaultKdfParams,
                                                             EntropyPtr entropy = nullptr);

    // Throws std::invalid_argument on an empty key.
    [[nodiscard]] static SymmetricMorph fromKey(std::span<const std::uint8_t> key, EntropyPtr entropy = nullptr);

    [[nodiscard]] static symmorph::security::SecureBuffer generateKey(std::size_t length = g_kDefaultKeyBytes,
                                                                      EntropyPtr entropy = nullptr);

    // Returns nonce || tag || payload, always g_kRecordHeaderBytes + plain.size() bytes.
    [[nodiscard]] std::vector<std::uint8_t> encrypt(std::span<const std::uint8_t> plain) const;

    // Deterministic variant for known-answer checks. Reusing a nonce under one key repeats the keystream.
    [[nodiscard]] std::vector<std::uint8_t> encryptWithNonce(std::span<const std::uint8_t> plain,
                                                             const Nonce& nonce) const;

    [[nodiscard]] CipherResult<symmorph::security::SecureBuffer> decrypt(std::span<const std::uint8_t> record) const;

    [[nodiscard]] std::vector<std::vector<std::uint8_t>>
    encryptChunks(std::span<const std::vector<std::uint8_t>> chunks) const;

    // One result per record; a failing record does not affect its neighbours.
    [[nodiscard]] std::vector<CipherResult<symmorph::security::SecureBuffer>>
    decryptChunks(std::span<const std::vector<std::uint8_t>> records) const;

    [[nodiscard]] std::size_t keySize() const noexcept
    {
        return m_key.size();
    }

    [[nodiscard]] const EntropySource& entropy() const noexcept
    {
        return *m_entropy;
    }

private:
    SymmetricMorph(symmorph::security::SecureBuffer key, EntropyPtr entropy);

    symmorph::security::SecureBuffer m_key;
    EntropyPtr m_entropy;
};

struct PasswordCipher final
{
    SymmetricMorph cipher;
    symmorph::security::SecureBuffer salt;
};

[[nodiscard]] const char* describe(CipherError error) noexcept;

} // namespace symmorph::crypto

#endif // INCLUDE_SYMMORPH_CRYPTO_SYMMETRICMORPH_HPP
