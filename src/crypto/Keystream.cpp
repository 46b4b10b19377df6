#include "symmorph/crypto/Keystream.hpp"

#include "symmorph/security/MemoryWiper.hpp"

#include <stdexcept>

namespace symmorph::crypto
{
namespace
{

constexpr std::uint64_t g_kSeedStride{ 97U };
constexpr std::uint64_t g_kSecondStride{ 5U };
constexpr std::uint64_t g_kSecondOffset{ 11U };
constexpr std::uint64_t g_kThirdStride{ 7U };
constexpr std::uint64_t g_kThirdOffset{ 17U };
constexpr std::uint64_t g_kFoldShiftModulus{ 7U };

} // namespace

Keystream::Keystream(std::span<const std::uint8_t> seed)
{
    if (seed.empty())
    {
        throw std::invalid_argument("Keystream: empty seed");
    }

    for (std::size_t n{}; n < m_table.size(); ++n)
    {
        const auto tweak{ static_cast<std::uint8_t>((n * g_kSeedStride) % 256U) };
        m_table[n] = static_cast<std::uint8_t>(seed[n % seed.size()] ^ tweak);
    }
}

Keystream::~Keystream() noexcept
{
    symmorph::security::secureWipe(m_table);
    m_counter = 0U;
}

std::uint8_t Keystream::next() noexcept
{
    constexpr std::uint64_t kTableSize{ g_kKeystreamTableBytes };

    // 64 divides 2^64, so the wrapped counter still yields the right table indices.
    const std::size_t i{ static_cast<std::size_t>(m_counter % kTableSize) };
    const std::size_t j{ static_cast<std::size_t>((m_counter * g_kSecondStride + g_kSecondOffset) % kTableSize) };
    const std::size_t k{ static_cast<std::size_t>((m_counter * g_kThirdStride + g_kThirdOffset) % kTableSize) };

    const unsigned mixed{ static_cast<unsigned>(m_table[j] ^ (m_table[k] >> 3U)) };
    const auto value{ static_cast<std::uint8_t>((m_table[i] + mixed + static_cast<unsigned>(m_counter & 0xFFU)) &
                                                0xFFU) };

    const auto shift{ static_cast<unsigned>(m_counter % g_kFoldShiftModulus) };
    m_table[i] = static_cast<std::uint8_t>((m_table[i] ^ (static_cast<unsigned>(value) << shift)) & 0xFFU);

    ++m_counter;
    return value;
}

void Keystream::fill(std::span<std::uint8_t> out) noexcept
{
    for (auto& b : out)
    {
        b = next();
    }
}

} // namespace symmorph::crypto
