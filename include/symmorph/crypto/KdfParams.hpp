#ifndef INCLUDE_SYMMORPH_CRYPTO_KDFPARAMS_HPP
#define INCLUDE_SYMMORPH_CRYPTO_KDFPARAMS_HPP

#include <cstddef>
#include <cstdint>

namespace symmorph::crypto
{

constexpr std::uint32_t g_kDefaultKdfIterations{ 20000U };
constexpr std::size_t g_kDefaultKeyBytes{ 64U };
constexpr std::size_t g_kDefaultSaltBytes{ 24U };

// Upper bounds accepted by deriveKey. Anything above is treated as a caller bug.
constexpr std::uint32_t g_kMaxKdfIterations{ 10'000'000U };
constexpr std::size_t g_kMaxKeyBytes{ 64U * 1024U };

struct KdfParams final
{
    std::uint32_t iterations{ g_kDefaultKdfIterations };
    std::size_t keyBytes{ g_kDefaultKeyBytes };
};

constexpr KdfParams g_kDefaultKdfParams{};

} // namespace symmorph::crypto

#endif // INCLUDE_SYMMORPH_CRYPTO_KDFPARAMS_HPP
