#include "symmorph/core/ChunkPipeline.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <thread>

namespace symmorph::core
{
namespace
{

// Splits [0, count) into at most `workers` contiguous ranges and runs `fn(index)` for every index.
// The first exception raised on any worker is rethrown once all workers have joined.
template <class Fn> void forEachIndex(std::size_t count, std::size_t workers, const Fn& fn)
{
    const std::size_t threads{ std::min(std::max<std::size_t>(workers, 1U), count) };
    if (threads <= 1U)
    {
        for (std::size_t i{}; i < count; ++i)
        {
            fn(i);
        }
        return;
    }

    std::vector<std::exception_ptr> failures(threads);
    {
        std::vector<std::jthread> pool{};
        pool.reserve(threads);

        const std::size_t base{ count / threads };
        const std::size_t extra{ count % threads };
        std::size_t begin{ 0U };
        for (std::size_t t{}; t < threads; ++t)
        {
            const std::size_t end{ begin + base + (t < extra ? 1U : 0U) };
            pool.emplace_back(
                [&fn, &failures, t, begin, end]()
                {
                    try
                    {
                        for (std::size_t i{ begin }; i < end; ++i)
                        {
                            fn(i);
                        }
                    }
                    catch (...)
                    {
                        failures[t] = std::current_exception();
                    }
                });
            begin = end;
        }
    }

    for (const auto& failure : failures)
    {
        if (failure)
        {
            std::rethrow_exception(failure);
        }
    }
}

} // namespace

[[nodiscard]] std::vector<std::vector<std::uint8_t>> splitIntoChunks(std::span<const std::uint8_t> data,
                                                                     std::size_t chunkBytes)
{
    if (chunkBytes == 0U)
    {
        throw std::invalid_argument("splitIntoChunks: zero chunk size");
    }

    std::vector<std::vector<std::uint8_t>> chunks{};
    chunks.reserve((data.size() + chunkBytes - 1U) / chunkBytes);
    for (std::size_t offset{}; offset < data.size(); offset += chunkBytes)
    {
        const auto slice{ data.subspan(offset, std::min(chunkBytes, data.size() - offset)) };
        chunks.emplace_back(slice.begin(), slice.end());
    }
    return chunks;
}

ChunkPipeline::ChunkPipeline(const symmorph::crypto::SymmetricMorph& cipher, std::size_t workers) noexcept
    : m_cipher{ &cipher }, m_workers{ std::max<std::size_t>(workers, 1U) }
{
}

[[nodiscard]] std::vector<std::vector<std::uint8_t>>
ChunkPipeline::encryptAll(std::span<const std::vector<std::uint8_t>> chunks) const
{
    std::vector<std::vector<std::uint8_t>> out(chunks.size());
    forEachIndex(chunks.size(), m_workers, [&](std::size_t i) { out[i] = m_cipher->encrypt(chunks[i]); });
    return out;
}

[[nodiscard]] std::vector<symmorph::crypto::CipherResult<symmorph::security::SecureBuffer>>
ChunkPipeline::decryptAll(std::span<const std::vector<std::uint8_t>> records) const
{
    std::vector<symmorph::crypto::CipherResult<symmorph::security::SecureBuffer>> out(records.size());
    forEachIndex(records.size(), m_workers, [&](std::size_t i) { out[i] = m_cipher->decrypt(records[i]); });
    return out;
}

} // namespace symmorph::core
