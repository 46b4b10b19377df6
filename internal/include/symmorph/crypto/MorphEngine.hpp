#ifndef INTERNAL_INCLUDE_SYMMORPH_CRYPTO_MORPHENGINE_HPP
#define INTERNAL_INCLUDE_SYMMORPH_CRYPTO_MORPHENGINE_HPP

#include "symmorph/crypto/CipherRecord.hpp"
#include "symmorph/crypto/DiffusionState.hpp"
#include "symmorph/crypto/Keystream.hpp"
#include <cstddef>
#include <cstdint>
#include <span>

namespace symmorph::crypto
{

constexpr std::uint8_t g_kInitialFeedback{ 0xA5U };
constexpr std::uint8_t g_kInitialPrev1{ 0x6CU };
constexpr std::uint8_t g_kInitialPrev2{ 0x3AU };
constexpr std::uint8_t g_kInitialPrev3{ 0x91U };

// One encrypt or decrypt pass over a single record. Lives on the caller's stack for exactly one call.
// Every piece of carried state is driven by ciphertext bytes, so both directions walk the same trajectory.
class MorphEngine final
{
public:
    MorphEngine(std::span<const std::uint8_t> key, const Nonce& nonce);

    MorphEngine(const MorphEngine&) = delete;
    MorphEngine& operator=(const MorphEngine&) = delete;
    MorphEngine(MorphEngine&&) = delete;
    MorphEngine& operator=(MorphEngine&&) = delete;
    ~MorphEngine() = default;

    [[nodiscard]] std::uint8_t encryptByte(std::uint8_t plain) noexcept;
    [[nodiscard]] std::uint8_t decryptByte(std::uint8_t cipher) noexcept;

    void encrypt(std::span<const std::uint8_t> in, std::span<std::uint8_t> out) noexcept;
    void decrypt(std::span<const std::uint8_t> in, std::span<std::uint8_t> out) noexcept;

    [[nodiscard]] std::uint8_t macAccumulator() const noexcept
    {
        return m_macAcc;
    }

private:
    [[nodiscard]] std::uint8_t maskAt() const noexcept;
    void absorb(std::uint8_t cipher, std::uint8_t r) noexcept;

    Keystream m_keystream;
    DiffusionState m_state;
    std::size_t m_index{ 0U };
    std::uint8_t m_feedback{ g_kInitialFeedback };
    std::uint8_t m_prev1{ g_kInitialPrev1 };
    std::uint8_t m_prev2{ g_kInitialPrev2 };
    std::uint8_t m_prev3{ g_kInitialPrev3 };
    std::uint8_t m_macAcc{ g_kMacAccumulatorSeed };
};

} // namespace symmorph::crypto

#endif // INTERNAL_INCLUDE_SYMMORPH_CRYPTO_MORPHENGINE_HPP
