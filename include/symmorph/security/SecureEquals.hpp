#ifndef INCLUDE_SYMMORPH_SECURITY_SECUREEQUALS_HPP
#define INCLUDE_SYMMORPH_SECURITY_SECUREEQUALS_HPP

#include <cstddef>
#include <cstdint>
#include <span>

namespace symmorph::security
{
// Tag comparison. Lengths are checked first and a mismatch returns false before any byte is read.
// Equal-length inputs are scanned to the end regardless of where the first difference sits.
[[nodiscard]] inline bool secureEquals(std::span<const std::uint8_t> a, std::span<const std::uint8_t> b) noexcept
{
    if (a.size() != b.size())
    {
        return false;
    }

    volatile std::uint8_t diff{ 0U };
    for (std::size_t i{}; i < a.size(); ++i)
    {
        diff = static_cast<std::uint8_t>(diff | (a[i] ^ b[i]));
    }
    return diff == 0U;
}

} // namespace symmorph::security

#endif // INCLUDE_SYMMORPH_SECURITY_SECUREEQUALS_HPP
