#include "symmorph/crypto/EntropySource.hpp"

#include "symmorph/crypto/Keystream.hpp"

#include <array>

namespace symmorph::crypto
{
namespace
{

constexpr std::array<std::uint64_t, 4> g_kNonceModuli{ 251U, 241U, 239U, 233U };
constexpr std::uint64_t g_kBitsPerByte{ 8U };
constexpr std::uint64_t g_kByteMask{ 0xFFU };

[[nodiscard]] symmorph::security::SecureBuffer drawFrom(std::span<const std::uint8_t> seed, std::size_t length)
{
    Keystream stream{ seed };
    symmorph::security::SecureBuffer out{};
    out.resize(length);
    stream.fill(std::span<std::uint8_t>{ out });
    return out;
}

} // namespace

[[nodiscard]] Nonce nonceFromMillis(std::uint64_t unixMillis) noexcept
{
    Nonce nonce{};
    for (std::size_t i{}; i < 4U; ++i)
    {
        nonce[i] = static_cast<std::uint8_t>((unixMillis >> (i * g_kBitsPerByte)) & g_kByteMask);
    }
    for (std::size_t i{}; i < g_kNonceModuli.size(); ++i)
    {
        nonce[4U + i] = static_cast<std::uint8_t>(unixMillis % g_kNonceModuli[i]);
    }
    return nonce;
}

[[nodiscard]] symmorph::security::SecureBuffer saltFromUptime(std::uint64_t uptimeMillis, std::size_t length)
{
    const std::array<std::uint8_t, 3> seed{
        static_cast<std::uint8_t>(uptimeMillis & g_kByteMask),
        static_cast<std::uint8_t>((uptimeMillis >> g_kBitsPerByte) & g_kByteMask),
        static_cast<std::uint8_t>((uptimeMillis >> (2U * g_kBitsPerByte)) & g_kByteMask),
    };
    return drawFrom(seed, length);
}

[[nodiscard]] symmorph::security::SecureBuffer keyFromMillis(std::uint64_t unixMillis, std::size_t length)
{
    const std::array<std::uint8_t, 1> seed{ static_cast<std::uint8_t>(unixMillis & g_kByteMask) };
    return drawFrom(seed, length);
}

} // namespace symmorph::crypto
