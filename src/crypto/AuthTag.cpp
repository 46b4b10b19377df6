#include "symmorph/crypto/AuthTag.hpp"

#include "symmorph/security/SecureEquals.hpp"

#include <stdexcept>

namespace symmorph::crypto
{

[[nodiscard]] AuthTag computeAuthTag(std::uint8_t macAccumulator, std::span<const std::uint8_t> key)
{
    if (key.empty())
    {
        throw std::invalid_argument("computeAuthTag: empty key");
    }

    constexpr std::size_t kTagStride{ 19U };

    AuthTag tag{};
    for (std::size_t j{}; j < tag.size(); ++j)
    {
        tag[j] = static_cast<std::uint8_t>((macAccumulator ^ key[j % key.size()] ^ (j * kTagStride)) & 0xFFU);
    }
    return tag;
}

[[nodiscard]] bool verifyAuthTag(std::span<const std::uint8_t> expected, std::span<const std::uint8_t> received) noexcept
{
    return symmorph::security::secureEquals(expected, received);
}

} // namespace symmorph::crypto
