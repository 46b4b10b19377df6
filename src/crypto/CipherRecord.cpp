#include "symmorph/crypto/CipherRecord.hpp"

#include <algorithm>

namespace symmorph::crypto
{

[[nodiscard]] std::vector<std::uint8_t> makeRecordBuffer(const Nonce& nonce, std::size_t payloadBytes)
{
    std::vector<std::uint8_t> record(g_kRecordHeaderBytes + payloadBytes);
    std::copy(nonce.begin(), nonce.end(), record.begin());
    return record;
}

void writeRecordTag(std::span<std::uint8_t> record, const AuthTag& tag) noexcept
{
    if (record.size() < g_kRecordHeaderBytes)
    {
        return;
    }
    std::copy(tag.begin(), tag.end(), record.begin() + static_cast<std::ptrdiff_t>(g_kNonceBytes));
}

[[nodiscard]] std::optional<CipherRecordView> parseRecord(std::span<const std::uint8_t> record) noexcept
{
    if (record.size() < g_kRecordHeaderBytes)
    {
        return std::nullopt;
    }

    return CipherRecordView{
        .nonce = record.first<g_kNonceBytes>(),
        .tag = record.subspan<g_kNonceBytes, g_kAuthTagBytes>(),
        .payload = record.subspan(g_kRecordHeaderBytes),
    };
}

} // namespace symmorph::crypto
