#ifndef INCLUDE_SYMMORPH_SECURITY_SECUREBUFFER_HPP
#define INCLUDE_SYMMORPH_SECURITY_SECUREBUFFER_HPP

#include "symmorph/security/ZeroAllocator.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace symmorph::security
{
// Owning byte buffer for keys, salts and recovered plaintext.
using SecureBuffer = std::vector<std::uint8_t, ZeroAllocator<std::uint8_t>>;

[[nodiscard]] inline SecureBuffer secureBufferFrom(std::span<const std::uint8_t> bytes)
{
    // NOLINTNEXTLINE(modernize-return-braced-init-list)
    return SecureBuffer(bytes.begin(), bytes.end());
}

[[nodiscard]] inline std::span<const std::uint8_t> asSpan(const SecureBuffer& b) noexcept
{
    return std::span{ b };
}

[[nodiscard]] inline std::span<std::byte> asWritableBytes(SecureBuffer& b) noexcept
{
    return std::as_writable_bytes(std::span{ b });
}

[[nodiscard]] inline std::span<const std::byte> asBytes(const SecureBuffer& b) noexcept
{
    return std::as_bytes(std::span{ b });
}

// Wipes the contents and gives the capacity back.
inline void secureRelease(SecureBuffer& b) noexcept
{
    secureWipe(asWritableBytes(b));
    SecureBuffer temp;
    b.swap(temp);
}

} // namespace symmorph::security

#endif // INCLUDE_SYMMORPH_SECURITY_SECUREBUFFER_HPP
