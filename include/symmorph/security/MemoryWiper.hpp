#ifndef INCLUDE_SYMMORPH_SECURITY_MEMORYWIPER_HPP
#define INCLUDE_SYMMORPH_SECURITY_MEMORYWIPER_HPP

#include <array>
#include <cstddef>
#include <span>
#include <type_traits>

namespace symmorph::security
{
// Zeroes `size` bytes at `data` in a way the optimizer may not elide. Null or zero size is a no-op.
void secureWipe(void* data, std::size_t size) noexcept;

template <typename T, std::size_t Extent>
    requires(!std::is_const_v<T> && std::is_trivially_copyable_v<T>)
void secureWipe(std::span<T, Extent> buffer) noexcept
{
    secureWipe(static_cast<void*>(buffer.data()), buffer.size_bytes());
}

// Keystream tables and diffusion state are fixed-size arrays.
template <typename T, std::size_t N>
    requires(std::is_trivially_copyable_v<T>)
void secureWipe(std::array<T, N>& buffer) noexcept
{
    secureWipe(std::span<T, N>{ buffer });
}
} // namespace symmorph::security
#endif // INCLUDE_SYMMORPH_SECURITY_MEMORYWIPER_HPP
