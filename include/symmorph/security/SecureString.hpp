#ifndef INCLUDE_SYMMORPH_SECURITY_SECURESTRING_HPP
#define INCLUDE_SYMMORPH_SECURITY_SECURESTRING_HPP

#include "symmorph/security/SecureBuffer.hpp"
#include "symmorph/security/ZeroAllocator.hpp"
#include <cstddef>
#include <span>
#include <string_view>
#include <vector>

namespace symmorph::security
{
// Password text as typed by the user.
using SecureString = std::vector<char, ZeroAllocator<char>>;

[[nodiscard]] inline SecureString secureStringFrom(std::string_view s)
{
    // Use parentheses to strictly enforce the Range Constructor.
    // NOLINTNEXTLINE(modernize-return-braced-init-list)
    return SecureString(s.begin(), s.end());
}

[[nodiscard]] inline std::string_view asStringView(const SecureString& s) noexcept
{
    if (s.empty())
    {
        return {};
    }
    return std::string_view{ s.data(), s.size() };
}

[[nodiscard]] inline std::span<std::byte> asWritableBytes(SecureString& s) noexcept
{
    return std::as_writable_bytes(std::span{ s });
}

[[nodiscard]] inline std::span<const std::byte> asBytes(const SecureString& s) noexcept
{
    return std::as_bytes(std::span{ s });
}

inline void secureRelease(SecureString& s) noexcept
{
    secureWipe(asWritableBytes(s));
    SecureString temp{};
    s.swap(temp);
}

} // namespace symmorph::security

#endif // INCLUDE_SYMMORPH_SECURITY_SECURESTRING_HPP
