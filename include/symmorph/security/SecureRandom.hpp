#ifndef INCLUDE_SYMMORPH_SECURITY_SECURERANDOM_HPP
#define INCLUDE_SYMMORPH_SECURITY_SECURERANDOM_HPP

#include <cstdint>
#include <span>

namespace symmorph::security
{

// Fills `out` from the operating system CSPRNG. Returns false if the source fails.
[[nodiscard]] bool secureRandomFill(std::span<std::uint8_t> out) noexcept;

} // namespace symmorph::security

#endif // INCLUDE_SYMMORPH_SECURITY_SECURERANDOM_HPP
