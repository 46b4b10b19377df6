#ifndef SYMMORPH_SRC_CORE_LITTLEENDIAN_HPP
#define SYMMORPH_SRC_CORE_LITTLEENDIAN_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace symmorph::core::detail
{

constexpr std::size_t g_kU32Bytes{ sizeof(std::uint32_t) };
constexpr std::uint32_t g_kByteMaskU32{ 0xFFU };
constexpr std::uint32_t g_kBitsPerByte{ 8U };

inline void appendU32LE(std::vector<std::uint8_t>& out, std::uint32_t v)
{
    for (std::size_t i{}; i < g_kU32Bytes; ++i)
    {
        const std::uint32_t shiftBits{ static_cast<std::uint32_t>(i) * g_kBitsPerByte };
        out.push_back(static_cast<std::uint8_t>((v >> shiftBits) & g_kByteMaskU32));
    }
}

// Sequential reader over an untrusted buffer. Every read is bounds-checked.
class ByteReader final
{
public:
    explicit ByteReader(std::span<const std::uint8_t> in) noexcept : m_in{ in }
    {
    }

    [[nodiscard]] std::optional<std::uint32_t> readU32LE() noexcept
    {
        if (remaining() < g_kU32Bytes)
        {
            return std::nullopt;
        }
        std::uint32_t v{ 0U };
        for (std::size_t i{}; i < g_kU32Bytes; ++i)
        {
            const std::uint32_t shiftBits{ static_cast<std::uint32_t>(i) * g_kBitsPerByte };
            v |= (static_cast<std::uint32_t>(m_in[m_offset + i]) << shiftBits);
        }
        m_offset += g_kU32Bytes;
        return v;
    }

    [[nodiscard]] std::optional<std::span<const std::uint8_t>> readBytes(std::size_t n) noexcept
    {
        if (remaining() < n)
        {
            return std::nullopt;
        }
        const auto out{ m_in.subspan(m_offset, n) };
        m_offset += n;
        return out;
    }

    [[nodiscard]] std::size_t remaining() const noexcept
    {
        return m_in.size() - m_offset;
    }

private:
    std::span<const std::uint8_t> m_in;
    std::size_t m_offset{ 0U };
};

} // namespace symmorph::core::detail

#endif // SYMMORPH_SRC_CORE_LITTLEENDIAN_HPP
