#ifndef ADAPTERS_INCLUDE_SYMMORPH_CRYPTO_ENTROPY_SYSTEMENTROPYFACTORY_HPP
#define ADAPTERS_INCLUDE_SYMMORPH_CRYPTO_ENTROPY_SYSTEMENTROPYFACTORY_HPP

#include "symmorph/crypto/EntropySource.hpp"
#include <memory>

namespace symmorph::crypto::entropy
{

// Opt-in source backed by the OS CSPRNG. Its calls throw std::runtime_error if the OS source fails.
[[nodiscard]] std::shared_ptr<const symmorph::crypto::EntropySource> makeSystemEntropySource();

} // namespace symmorph::crypto::entropy

#endif // ADAPTERS_INCLUDE_SYMMORPH_CRYPTO_ENTROPY_SYSTEMENTROPYFACTORY_HPP
