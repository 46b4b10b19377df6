#include "symmorph/crypto/KeyDerivation.hpp"

#include "symmorph/security/ScopeWipe.hpp"

#include <cstddef>
#include <cstdint>
#include <stdexcept>

namespace symmorph::crypto
{
namespace
{

constexpr std::uint32_t g_kPositionStride{ 7U };
constexpr std::uint32_t g_kOutputStride{ 37U };

void requireSupported(std::span<const std::byte> password, std::span<const std::uint8_t> salt, KdfParams params)
{
    if (password.empty() && salt.empty())
    {
        throw std::invalid_argument("deriveKey: empty password and salt");
    }
    if (params.iterations == 0U || params.iterations > g_kMaxKdfIterations)
    {
        throw std::invalid_argument("deriveKey: invalid iteration count");
    }
    if (params.keyBytes == 0U || params.keyBytes > g_kMaxKeyBytes)
    {
        throw std::invalid_argument("deriveKey: invalid key length");
    }
}

} // namespace

[[nodiscard]] symmorph::security::SecureBuffer deriveKey(std::span<const std::byte> password,
                                                         std::span<const std::uint8_t> salt, KdfParams params)
{
    requireSupported(password, salt, params);

    symmorph::security::SecureBuffer data{};
    data.reserve(password.size() + salt.size());
    for (const std::byte b : password)
    {
        data.push_back(std::to_integer<std::uint8_t>(b));
    }
    data.insert(data.end(), salt.begin(), salt.end());
    auto wipeData = symmorph::security::scopeWipe(data);

    // Each round rewrites the buffer in place; the fold uses the rewritten bytes only.
    std::uint32_t state{ 0U };
    for (std::uint32_t round{}; round < params.iterations; ++round)
    {
        std::uint8_t fold{ 0U };
        for (std::size_t j{}; j < data.size(); ++j)
        {
            const auto offset{ static_cast<std::uint32_t>(state + static_cast<std::uint32_t>(j) * g_kPositionStride +
                                                          round) };
            data[j] = static_cast<std::uint8_t>((data[j] ^ offset) & 0xFFU);
            fold ^= data[j];
        }
        state = (state + fold) & 0xFFU;
    }

    symmorph::security::SecureBuffer key{};
    key.resize(params.keyBytes);
    for (std::size_t n{}; n < key.size(); ++n)
    {
        const auto tweak{ static_cast<std::uint32_t>(static_cast<std::uint32_t>(n) * g_kOutputStride + state) };
        key[n] = static_cast<std::uint8_t>((data[n % data.size()] ^ tweak) & 0xFFU);
    }
    return key;
}

} // namespace symmorph::crypto
