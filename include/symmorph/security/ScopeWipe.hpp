#ifndef INCLUDE_SYMMORPH_SECURITY_SCOPEWIPE_HPP
#define INCLUDE_SYMMORPH_SECURITY_SCOPEWIPE_HPP

#include "symmorph/security/MemoryWiper.hpp"
#include "symmorph/security/SecureBuffer.hpp"
#include "symmorph/security/SecureString.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

namespace symmorph::security
{
// Wipes a borrowed byte range when the guard leaves scope, unless released first.
class [[nodiscard]] ScopeWipe final
{
public:
    ScopeWipe(const ScopeWipe&) = delete;
    ScopeWipe& operator=(const ScopeWipe&) = delete;

    explicit ScopeWipe(std::span<std::byte> b) noexcept : m_bytes{ b }
    {
    }

    ScopeWipe(ScopeWipe&& sw) noexcept : m_bytes{ sw.m_bytes }, m_active{ sw.m_active }
    {
        sw.release();
    }

    ~ScopeWipe() noexcept
    {
        if (!m_active || m_bytes.empty())
        {
            return;
        }
        secureWipe(m_bytes);
    }

    ScopeWipe& operator=(ScopeWipe&&) = delete;

    void release() noexcept
    {
        m_active = false;
        m_bytes = {};
    }

private:
    std::span<std::byte> m_bytes;
    bool m_active{ true };
};

[[nodiscard]] inline ScopeWipe scopeWipe(std::span<std::uint8_t> b) noexcept
{
    return ScopeWipe{ std::as_writable_bytes(b) };
}

template <std::size_t N> [[nodiscard]] ScopeWipe scopeWipe(std::array<std::uint8_t, N>& a) noexcept
{
    return ScopeWipe{ std::as_writable_bytes(std::span<std::uint8_t>{ a }) };
}

[[nodiscard]] inline ScopeWipe scopeWipe(SecureBuffer& b) noexcept
{
    return ScopeWipe{ asWritableBytes(b) };
}

[[nodiscard]] inline ScopeWipe scopeWipe(SecureString& s) noexcept
{
    return ScopeWipe{ asWritableBytes(s) };
}

} // namespace symmorph::security

#endif // INCLUDE_SYMMORPH_SECURITY_SCOPEWIPE_HPP
