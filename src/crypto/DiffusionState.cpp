#include "symmorph/crypto/DiffusionState.hpp"

#include "symmorph/security/ScopeWipe.hpp"

#include <stdexcept>

namespace symmorph::crypto
{
namespace
{

constexpr std::size_t g_kInitStride{ 67U };
constexpr std::size_t g_kInitOffset{ 19U };
constexpr std::size_t g_kMixStride{ 31U };
constexpr std::size_t g_kSwapStride{ 13U };
constexpr std::size_t g_kReverseStride{ 17U };
constexpr std::size_t g_kPermutePeriod{ 4U };
constexpr unsigned g_kForwardRotations{ 5U };
constexpr unsigned g_kReverseRotations{ 7U };

} // namespace

DiffusionState::DiffusionState(std::span<const std::uint8_t> key)
{
    if (key.empty())
    {
        throw std::invalid_argument("DiffusionState: empty key");
    }

    for (std::size_t n{}; n < m_bytes.size(); ++n)
    {
        const auto tweak{ static_cast<std::uint8_t>((n * g_kInitStride + g_kInitOffset) & 0xFFU) };
        m_bytes[n] = static_cast<std::uint8_t>(key[n % key.size()] ^ tweak);
    }
}

DiffusionState::~DiffusionState() noexcept
{
    symmorph::security::secureWipe(m_bytes);
}

void DiffusionState::update(const DiffusionStep& step) noexcept
{
    const auto inv{ static_cast<std::uint8_t>(~step.output & 0xFFU) };
    const auto mixed{ static_cast<std::uint8_t>(step.prev1 ^ step.prev2 ^ step.prev3 ^ step.feedback ^
                                                step.keystream) };
    const std::size_t len{ m_bytes.size() };

    for (std::size_t n{}; n < len; ++n)
    {
        const auto add{ static_cast<std::uint8_t>((step.output + mixed + n * g_kMixStride) & 0xFFU) };
        m_bytes[n] = rotateLeft8(static_cast<std::uint8_t>(m_bytes[n] ^ add),
                                 static_cast<unsigned>(n % g_kForwardRotations));
    }

    if (step.index % g_kPermutePeriod == g_kPermutePeriod - 1U)
    {
        std::array<std::uint8_t, g_kDiffusionStateBytes> snapshot{ m_bytes };
        auto wipeSnapshot = symmorph::security::scopeWipe(snapshot);
        for (std::size_t n{}; n < len; ++n)
        {
            const std::size_t swap{ (n * g_kSwapStride + step.index) % len };
            m_bytes[n] = static_cast<std::uint8_t>(snapshot[swap] ^ inv);
        }
    }

    for (std::size_t n{ len }; n-- > 0U;)
    {
        const auto tweak{ static_cast<std::uint8_t>((inv ^ (n * g_kReverseStride) ^ step.feedback) & 0xFFU) };
        m_bytes[n] = rotateRight8(static_cast<std::uint8_t>((m_bytes[n] + tweak) & 0xFFU),
                                  static_cast<unsigned>(n % g_kReverseRotations));
    }
}

} // namespace symmorph::crypto
