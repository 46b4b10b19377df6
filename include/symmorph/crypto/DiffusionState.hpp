#ifndef INCLUDE_SYMMORPH_CRYPTO_DIFFUSIONSTATE_HPP
#define INCLUDE_SYMMORPH_CRYPTO_DIFFUSIONSTATE_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

namespace symmorph::crypto
{

constexpr std::size_t g_kDiffusionStateBytes{ 64U };

// Inputs of one state update. Trackers hold their values from before the shift for this byte.
struct DiffusionStep final
{
    std::uint8_t output;
    std::uint8_t feedback;
    std::uint8_t keystream;
    std::size_t index;
    std::uint8_t prev1;
    std::uint8_t prev2;
    std::uint8_t prev3;
};

// Per-call 64-byte state that drives the mask selection. Wiped on destruction.
class DiffusionState final
{
public:
    // Throws std::invalid_argument on an empty key.
    explicit DiffusionState(std::span<const std::uint8_t> key);

    DiffusionState(const DiffusionState&) = delete;
    DiffusionState& operator=(const DiffusionState&) = delete;
    DiffusionState(DiffusionState&&) = delete;
    DiffusionState& operator=(DiffusionState&&) = delete;
    ~DiffusionState() noexcept;

    // Three passes over the whole state: mix-and-rotate, periodic permutation, reverse add-and-rotate.
    void update(const DiffusionStep& step) noexcept;

    [[nodiscard]] std::uint8_t operator[](std::size_t pos) const noexcept
    {
        return m_bytes[pos];
    }

    [[nodiscard]] static constexpr std::size_t size() noexcept
    {
        return g_kDiffusionStateBytes;
    }

private:
    std::array<std::uint8_t, g_kDiffusionStateBytes> m_bytes{};
};

[[nodiscard]] constexpr std::uint8_t rotateLeft8(std::uint8_t v, unsigned shift) noexcept
{
    const unsigned s{ shift & 7U };
    return static_cast<std::uint8_t>(((static_cast<unsigned>(v) << s) | (static_cast<unsigned>(v) >> (8U - s))) &
                                     0xFFU);
}

[[nodiscard]] constexpr std::uint8_t rotateRight8(std::uint8_t v, unsigned shift) noexcept
{
    const unsigned s{ shift & 7U };
    return static_cast<std::uint8_t>(((static_cast<unsigned>(v) >> s) | (static_cast<unsigned>(v) << (8U - s))) &
                                     0xFFU);
}

} // namespace symmorph::crypto

#endif // INCLUDE_SYMMORPH_CRYPTO_DIFFUSIONSTATE_HPP
