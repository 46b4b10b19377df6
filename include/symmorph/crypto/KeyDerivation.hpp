#ifndef INCLUDE_SYMMORPH_CRYPTO_KEYDERIVATION_HPP
#define INCLUDE_SYMMORPH_CRYPTO_KEYDERIVATION_HPP

#include "symmorph/crypto/KdfParams.hpp"
#include "symmorph/security/SecureBuffer.hpp"
#include <cstddef>
#include <cstdint>
#include <span>

namespace symmorph::crypto
{

// Iterated XOR/modulo mixing over password || salt.
// Throws std::invalid_argument when password and salt are both empty or params are out of range.
// Zero rounds and counts above g_kMaxKdfIterations are refused even though the mixing itself is defined
// for them, so keys made elsewhere with such counts cannot be re-derived here.
[[nodiscard]] symmorph::security::SecureBuffer deriveKey(std::span<const std::byte> password,
                                                         std::span<const std::uint8_t> salt, KdfParams params);

} // namespace symmorph::crypto

#endif // INCLUDE_SYMMORPH_CRYPTO_KEYDERIVATION_HPP
