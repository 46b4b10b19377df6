#include "symmorph/security/MemoryWiper.hpp"

#if defined(_WIN32)
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#include <Windows.h>
#elif defined(__linux__)
#include <string.h>
#else
#error Unsupported platform
#endif

namespace symmorph::security
{

void secureWipe(void* data, std::size_t size) noexcept
{
    if (data == nullptr || size == 0U)
    {
        return;
    }
#if defined(_WIN32)
    ::SecureZeroMemory(data, size);
#else
    ::explicit_bzero(data, size);
#endif
}

} // namespace symmorph::security
