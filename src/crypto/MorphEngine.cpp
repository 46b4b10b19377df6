#include "symmorph/crypto/MorphEngine.hpp"

#include "symmorph/security/SecureBuffer.hpp"

#include <algorithm>

namespace symmorph::crypto
{
namespace
{

constexpr std::size_t g_kRotationModulus{ 5U };
constexpr std::size_t g_kFeedbackStride{ 13U };
constexpr std::size_t g_kMacStride{ 31U };

[[nodiscard]] symmorph::security::SecureBuffer keystreamSeed(std::span<const std::uint8_t> key, const Nonce& nonce)
{
    symmorph::security::SecureBuffer seed{};
    seed.reserve(key.size() + nonce.size());
    seed.insert(seed.end(), key.begin(), key.end());
    seed.insert(seed.end(), nonce.begin(), nonce.end());
    return seed;
}

} // namespace

MorphEngine::MorphEngine(std::span<const std::uint8_t> key, const Nonce& nonce)
    : m_keystream{ keystreamSeed(key, nonce) }, m_state{ key }
{
}

std::uint8_t MorphEngine::maskAt() const noexcept
{
    const std::size_t pos{ (m_index + m_feedback + m_prev1 + m_prev2) % DiffusionState::size() };
    return static_cast<std::uint8_t>(m_state[pos] ^ m_feedback ^ m_prev1 ^ m_prev2 ^ m_prev3);
}

void MorphEngine::absorb(std::uint8_t cipher, std::uint8_t r) noexcept
{
    m_state.update(DiffusionStep{ .output = cipher,
                                  .feedback = m_feedback,
                                  .keystream = r,
                                  .index = m_index,
                                  .prev1 = m_prev1,
                                  .prev2 = m_prev2,
                                  .prev3 = m_prev3 });

    m_prev3 = m_prev2;
    m_prev2 = m_prev1;
    m_prev1 = cipher;

    m_feedback = static_cast<std::uint8_t>((m_feedback ^ cipher ^ r ^ (m_index * g_kFeedbackStride)) & 0xFFU);

    const std::size_t sum{ static_cast<std::size_t>(m_macAcc) + cipher + m_feedback + m_index * g_kMacStride };
    const std::size_t chain{ static_cast<std::size_t>(r) + m_prev1 + m_prev2 };
    m_macAcc = static_cast<std::uint8_t>((sum ^ chain) & 0xFFU);

    ++m_index;
}

std::uint8_t MorphEngine::encryptByte(std::uint8_t plain) noexcept
{
    const std::uint8_t r{ m_keystream.next() };
    const auto mixed{ static_cast<std::uint8_t>(plain ^ maskAt() ^ r) };
    const std::uint8_t cipher{ rotateLeft8(mixed, static_cast<unsigned>(m_index % g_kRotationModulus)) };
    absorb(cipher, r);
    return cipher;
}

std::uint8_t MorphEngine::decryptByte(std::uint8_t cipher) noexcept
{
    const std::uint8_t r{ m_keystream.next() };
    const std::uint8_t unrotated{ rotateRight8(cipher, static_cast<unsigned>(m_index % g_kRotationModulus)) };
    const auto plain{ static_cast<std::uint8_t>(unrotated ^ maskAt() ^ r) };
    absorb(cipher, r);
    return plain;
}

void MorphEngine::encrypt(std::span<const std::uint8_t> in, std::span<std::uint8_t> out) noexcept
{
    const std::size_t n{ std::min(in.size(), out.size()) };
    for (std::size_t i{}; i < n; ++i)
    {
        out[i] = encryptByte(in[i]);
    }
}

void MorphEngine::decrypt(std::span<const std::uint8_t> in, std::span<std::uint8_t> out) noexcept
{
    const std::size_t n{ std::min(in.size(), out.size()) };
    for (std::size_t i{}; i < n; ++i)
    {
        out[i] = decryptByte(in[i]);
    }
}

} // namespace symmorph::crypto
