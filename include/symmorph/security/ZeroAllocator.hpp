#ifndef INCLUDE_SYMMORPH_SECURITY_ZEROALLOCATOR_HPP
#define INCLUDE_SYMMORPH_SECURITY_ZEROALLOCATOR_HPP

#include "symmorph/security/MemoryWiper.hpp"
#include <cstddef>
#include <limits>
#include <new>
#include <type_traits>

namespace symmorph::security
{
// Backs SecureBuffer and SecureString: every block is zeroed before it goes back to the heap,
// including the old block a growing buffer leaves behind.
template <class T> struct ZeroAllocator
{
    static_assert(std::is_trivially_copyable_v<T>, "ZeroAllocator only holds plain bytes");

    using value_type = T;
    using is_always_equal = std::true_type;
    using propagate_on_container_move_assignment = std::true_type;
    using propagate_on_container_swap = std::true_type;

    ZeroAllocator() noexcept = default;

    template <class U> constexpr explicit ZeroAllocator(const ZeroAllocator<U>& /*other*/) noexcept
    {
    }

    [[nodiscard]] static constexpr std::size_t max_size() noexcept
    {
        return std::numeric_limits<std::size_t>::max() / sizeof(T);
    }

    [[nodiscard]] T* allocate(std::size_t n)
    {
        if (n == 0U)
        {
            return nullptr;
        }
        if (n > max_size())
        {
            throw std::bad_array_new_length{};
        }
        return static_cast<T*>(::operator new(n * sizeof(T), std::align_val_t{ alignof(T) }));
    }

    void deallocate(T* p, std::size_t n) noexcept
    {
        if (p == nullptr)
        {
            return;
        }
        secureWipe(static_cast<void*>(p), n * sizeof(T));
        ::operator delete(p, std::align_val_t{ alignof(T) });
    }
};

template <class T, class U>
constexpr bool operator==(const ZeroAllocator<T>& /*lhs*/, const ZeroAllocator<U>& /*rhs*/) noexcept
{
    return true;
}

} // namespace symmorph::security

#endif // INCLUDE_SYMMORPH_SECURITY_ZEROALLOCATOR_HPP
