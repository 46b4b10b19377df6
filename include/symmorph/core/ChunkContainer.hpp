#ifndef INCLUDE_SYMMORPH_CORE_CHUNKCONTAINER_HPP
#define INCLUDE_SYMMORPH_CORE_CHUNKCONTAINER_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace symmorph::core
{

constexpr std::array<std::uint8_t, 4> g_kContainerMagic{ 'S', 'M', 'C', '1' };
constexpr std::uint32_t g_kContainerVersionV1{ 1U };
constexpr std::uint32_t g_kContainerVersionCurrent{ g_kContainerVersionV1 };

enum class KeyMode : std::uint32_t
{
    Password = 1U,
    RawKey = 2U,
};

// Everything needed to rebuild the cipher, except the secret itself.
struct ContainerHeader final
{
    std::uint32_t version{ g_kContainerVersionCurrent };
    KeyMode keyMode{ KeyMode::Password };
    std::uint32_t iterations{ 0U };
    std::uint32_t keyBytes{ 0U };
    std::vector<std::uint8_t> salt;
    std::uint32_t chunkBytes{ 0U };
};

struct ChunkContainer final
{
    ContainerHeader header;
    std::vector<std::vector<std::uint8_t>> records;
};

// Layout, little-endian:
//   magic[4] version keyMode iterations keyBytes saltLen salt[saltLen] chunkBytes chunkCount
//   chunkCount x (recordLen record[recordLen])
// Throws std::invalid_argument when a length does not fit in 32 bits.
[[nodiscard]] std::vector<std::uint8_t> encodeChunkContainer(const ChunkContainer& container);

// std::nullopt on bad magic/version/key mode, truncation, short records or trailing bytes.
[[nodiscard]] std::optional<ChunkContainer> decodeChunkContainer(std::span<const std::uint8_t> bytes);

} // namespace symmorph::core

#endif // INCLUDE_SYMMORPH_CORE_CHUNKCONTAINER_HPP
