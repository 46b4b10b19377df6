#ifndef INCLUDE_SYMMORPH_CRYPTO_KEYSTREAM_HPP
#define INCLUDE_SYMMORPH_CRYPTO_KEYSTREAM_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

namespace symmorph::crypto
{

constexpr std::size_t g_kKeystreamTableBytes{ 64U };

// Counter-driven byte generator over a 64-byte table. Deterministic for a given seed.
// Not copyable: two copies would hand out the same bytes twice.
class Keystream final
{
public:
    // Throws std::invalid_argument on an empty seed.
    explicit Keystream(std::span<const std::uint8_t> seed);

    Keystream(const Keystream&) = delete;
    Keystream& operator=(const Keystream&) = delete;
    Keystream(Keystream&&) = delete;
    Keystream& operator=(Keystream&&) = delete;
    ~Keystream() noexcept;

    [[nodiscard]] std::uint8_t next() noexcept;

    void fill(std::span<std::uint8_t> out) noexcept;

private:
    std::array<std::uint8_t, g_kKeystreamTableBytes> m_table{};
    std::uint64_t m_counter{ 0U };
};

} // namespace symmorph::crypto

#endif // INCLUDE_SYMMORPH_CRYPTO_KEYSTREAM_HPP
