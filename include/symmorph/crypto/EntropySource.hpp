#ifndef INCLUDE_SYMMORPH_CRYPTO_ENTROPYSOURCE_HPP
#define INCLUDE_SYMMORPH_CRYPTO_ENTROPYSOURCE_HPP

#include "symmorph/crypto/CipherRecord.hpp"
#include "symmorph/security/SecureBuffer.hpp"
#include <cstddef>
#include <cstdint>

namespace symmorph::crypto
{

// Where nonces, salts and generated raw keys come from.
// Implementations must be safe to call from several threads at once.
class EntropySource
{
public:
    EntropySource() = default;
    EntropySource(const EntropySource&) = delete;
    EntropySource& operator=(const EntropySource&) = delete;
    EntropySource(EntropySource&&) = delete;
    EntropySource& operator=(EntropySource&&) = delete;
    virtual ~EntropySource() = default;

    [[nodiscard]] virtual Nonce nonce() const = 0;
    [[nodiscard]] virtual symmorph::security::SecureBuffer salt(std::size_t length) const = 0;
    [[nodiscard]] virtual symmorph::security::SecureBuffer key(std::size_t length) const = 0;
};

// Clock-derived material. These reproduce the reference behaviour bit for bit and are
// predictable to anyone who knows roughly when they ran.

// Bytes 0..3: the low 32 bits of `unixMillis`, little-endian; bytes 4..7: residues mod 251, 241, 239, 233.
[[nodiscard]] Nonce nonceFromMillis(std::uint64_t unixMillis) noexcept;

// Keystream seeded with the low three bytes of `uptimeMillis`.
[[nodiscard]] symmorph::security::SecureBuffer saltFromUptime(std::uint64_t uptimeMillis, std::size_t length);

// Keystream seeded with the low byte of `unixMillis`, so at most 256 distinct keys per length.
[[nodiscard]] symmorph::security::SecureBuffer keyFromMillis(std::uint64_t unixMillis, std::size_t length);

} // namespace symmorph::crypto

#endif // INCLUDE_SYMMORPH_CRYPTO_ENTROPYSOURCE_HPP
