#include "symmorph/core/ChunkContainer.hpp"

#include "LittleEndian.hpp"
#include "symmorph/crypto/CipherRecord.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>

namespace symmorph::core
{
namespace
{

[[nodiscard]] std::uint32_t checkedU32(std::size_t n, const char* what)
{
    if (n > std::numeric_limits<std::uint32_t>::max())
    {
        throw std::invalid_argument(what);
    }
    return static_cast<std::uint32_t>(n);
}

[[nodiscard]] bool isKnownKeyMode(std::uint32_t raw) noexcept
{
    return raw == static_cast<std::uint32_t>(KeyMode::Password) || raw == static_cast<std::uint32_t>(KeyMode::RawKey);
}

} // namespace

[[nodiscard]] std::vector<std::uint8_t> encodeChunkContainer(const ChunkContainer& container)
{
    const auto& header{ container.header };

    std::vector<std::uint8_t> out{};
    out.insert(out.end(), g_kContainerMagic.begin(), g_kContainerMagic.end());
    detail::appendU32LE(out, header.version);
    detail::appendU32LE(out, static_cast<std::uint32_t>(header.keyMode));
    detail::appendU32LE(out, header.iterations);
    detail::appendU32LE(out, header.keyBytes);
    detail::appendU32LE(out, checkedU32(header.salt.size(), "encodeChunkContainer: salt too large"));
    out.insert(out.end(), header.salt.begin(), header.salt.end());
    detail::appendU32LE(out, header.chunkBytes);
    detail::appendU32LE(out, checkedU32(container.records.size(), "encodeChunkContainer: too many chunks"));

    for (const auto& record : container.records)
    {
        detail::appendU32LE(out, checkedU32(record.size(), "encodeChunkContainer: record too large"));
        out.insert(out.end(), record.begin(), record.end());
    }
    return out;
}

[[nodiscard]] std::optional<ChunkContainer> decodeChunkContainer(std::span<const std::uint8_t> bytes)
{
    detail::ByteReader reader{ bytes };

    const auto magic{ reader.readBytes(g_kContainerMagic.size()) };
    if (!magic || !std::equal(magic->begin(), magic->end(), g_kContainerMagic.begin()))
    {
        return std::nullopt;
    }

    ChunkContainer container{};
    auto& header{ container.header };

    const auto version{ reader.readU32LE() };
    if (!version || *version != g_kContainerVersionV1)
    {
        return std::nullopt;
    }
    header.version = *version;

    const auto keyMode{ reader.readU32LE() };
    if (!keyMode || !isKnownKeyMode(*keyMode))
    {
        return std::nullopt;
    }
    header.keyMode = static_cast<KeyMode>(*keyMode);

    const auto iterations{ reader.readU32LE() };
    const auto keyBytes{ reader.readU32LE() };
    const auto saltLen{ reader.readU32LE() };
    if (!iterations || !keyBytes || !saltLen)
    {
        return std::nullopt;
    }
    header.iterations = *iterations;
    header.keyBytes = *keyBytes;

    const auto salt{ reader.readBytes(*saltLen) };
    if (!salt)
    {
        return std::nullopt;
    }
    header.salt.assign(salt->begin(), salt->end());

    const auto chunkBytes{ reader.readU32LE() };
    const auto chunkCount{ reader.readU32LE() };
    if (!chunkBytes || !chunkCount)
    {
        return std::nullopt;
    }
    header.chunkBytes = *chunkBytes;

    // Each record costs at least its length prefix plus the record header.
    constexpr std::size_t kMinRecordCost{ detail::g_kU32Bytes + symmorph::crypto::g_kRecordHeaderBytes };
    if (*chunkCount > reader.remaining() / kMinRecordCost)
    {
        return std::nullopt;
    }
    container.records.reserve(*chunkCount);

    for (std::uint32_t i{}; i < *chunkCount; ++i)
    {
        const auto recordLen{ reader.readU32LE() };
        if (!recordLen || *recordLen < symmorph::crypto::g_kRecordHeaderBytes)
        {
            return std::nullopt;
        }
        const auto record{ reader.readBytes(*recordLen) };
        if (!record)
        {
            return std::nullopt;
        }
        container.records.emplace_back(record->begin(), record->end());
    }

    if (reader.remaining() != 0U)
    {
        return std::nullopt;
    }
    return container;
}

} // namespace symmorph::core
