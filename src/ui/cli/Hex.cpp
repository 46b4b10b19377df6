#include "Hex.hpp"

namespace symmorph::ui::cli
{
namespace
{

constexpr std::uint8_t g_kNibbleShift{ 4U };
constexpr std::uint8_t g_kNibbleMask{ 0x0FU };

[[nodiscard]] std::optional<std::uint8_t> nibble(char c) noexcept
{
    if (c >= '0' && c <= '9')
    {
        return static_cast<std::uint8_t>(c - '0');
    }
    if (c >= 'a' && c <= 'f')
    {
        return static_cast<std::uint8_t>(c - 'a' + 10);
    }
    if (c >= 'A' && c <= 'F')
    {
        return static_cast<std::uint8_t>(c - 'A' + 10);
    }
    return std::nullopt;
}

} // namespace

std::string toHex(std::span<const std::uint8_t> bytes)
{
    constexpr char kHex[] = "0123456789abcdef";

    std::string out{};
    out.reserve(bytes.size() * 2U);
    for (const std::uint8_t b : bytes)
    {
        out.push_back(kHex[(b >> g_kNibbleShift) & g_kNibbleMask]);
        out.push_back(kHex[b & g_kNibbleMask]);
    }
    return out;
}

std::optional<symmorph::security::SecureBuffer> parseHex(std::string_view text)
{
    if (text.size() % 2U != 0U)
    {
        return std::nullopt;
    }

    symmorph::security::SecureBuffer out{};
    out.reserve(text.size() / 2U);
    for (std::size_t i{}; i < text.size(); i += 2U)
    {
        const auto hi{ nibble(text[i]) };
        const auto lo{ nibble(text[i + 1U]) };
        if (!hi || !lo)
        {
            symmorph::security::secureRelease(out);
            return std::nullopt;
        }
        out.push_back(static_cast<std::uint8_t>((*hi << g_kNibbleShift) | *lo));
    }
    return out;
}

} // namespace symmorph::ui::cli
