#ifndef ADAPTERS_INCLUDE_SYMMORPH_CRYPTO_ENTROPY_CLOCKENTROPYFACTORY_HPP
#define ADAPTERS_INCLUDE_SYMMORPH_CRYPTO_ENTROPY_CLOCKENTROPYFACTORY_HPP

#include "symmorph/crypto/EntropySource.hpp"
#include <cstdint>
#include <functional>
#include <memory>

namespace symmorph::crypto::entropy
{

// In tests: returns a pinned reading.
using MillisProvider = std::function<std::uint64_t()>;

// Milliseconds since the Unix epoch.
[[nodiscard]] std::uint64_t wallClockMillis() noexcept;

// Milliseconds since this process loaded the library.
[[nodiscard]] std::uint64_t uptimeMillis() noexcept;

// Default source: nonces and keys from the wall clock, salts from process uptime.
[[nodiscard]] std::shared_ptr<const symmorph::crypto::EntropySource>
makeClockEntropySource(MillisProvider wallClock = wallClockMillis, MillisProvider uptime = uptimeMillis);

} // namespace symmorph::crypto::entropy

#endif // ADAPTERS_INCLUDE_SYMMORPH_CRYPTO_ENTROPY_CLOCKENTROPYFACTORY_HPP
