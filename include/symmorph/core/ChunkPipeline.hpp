#ifndef INCLUDE_SYMMORPH_CORE_CHUNKPIPELINE_HPP
#define INCLUDE_SYMMORPH_CORE_CHUNKPIPELINE_HPP

#include "symmorph/crypto/SymmetricMorph.hpp"
#include "symmorph/security/SecureBuffer.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace symmorph::core
{

// Consecutive slices of at most `chunkBytes`. Empty input gives no chunks.
// Throws std::invalid_argument when chunkBytes is zero.
[[nodiscard]] std::vector<std::vector<std::uint8_t>> splitIntoChunks(std::span<const std::uint8_t> data,
                                                                     std::size_t chunkBytes);

// Fans independent chunk calls out over worker threads. The cipher must outlive the pipeline.
class ChunkPipeline final
{
public:
    ChunkPipeline(const symmorph::crypto::SymmetricMorph& cipher, std::size_t workers) noexcept;

    // Output order matches input order. An exception thrown on a worker is rethrown here.
    [[nodiscard]] std::vector<std::vector<std::uint8_t>> encryptAll(std::span<const std::vector<std::uint8_t>> chunks) const;

    [[nodiscard]] std::vector<symmorph::crypto::CipherResult<symmorph::security::SecureBuffer>>
    decryptAll(std::span<const std::vector<std::uint8_t>> records) const;

    [[nodiscard]] std::size_t workers() const noexcept
    {
        return m_workers;
    }

private:
    const symmorph::crypto::SymmetricMorph* m_cipher{ nullptr };
    std::size_t m_workers{ 1U };
};

} // namespace symmorph::core

#endif // INCLUDE_SYMMORPH_CORE_CHUNKPIPELINE_HPP
