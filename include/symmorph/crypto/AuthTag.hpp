#ifndef INCLUDE_SYMMORPH_CRYPTO_AUTHTAG_HPP
#define INCLUDE_SYMMORPH_CRYPTO_AUTHTAG_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

namespace symmorph::crypto
{

constexpr std::size_t g_kAuthTagBytes{ 32U };
constexpr std::uint8_t g_kMacAccumulatorSeed{ 157U };

using AuthTag = std::array<std::uint8_t, g_kAuthTagBytes>;

// Expands the final one-byte accumulator into a 32-byte tag bound to the key.
// Throws std::invalid_argument on an empty key.
[[nodiscard]] AuthTag computeAuthTag(std::uint8_t macAccumulator, std::span<const std::uint8_t> key);

// Constant-time. A length mismatch is a failed check, not an error.
[[nodiscard]] bool verifyAuthTag(std::span<const std::uint8_t> expected, std::span<const std::uint8_t> received) noexcept;

} // namespace symmorph::crypto

#endif // INCLUDE_SYMMORPH_CRYPTO_AUTHTAG_HPP
