#ifndef INCLUDE_SYMMORPH_CRYPTO_CIPHERRECORD_HPP
#define INCLUDE_SYMMORPH_CRYPTO_CIPHERRECORD_HPP

#include "symmorph/crypto/AuthTag.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace symmorph::crypto
{

constexpr std::size_t g_kNonceBytes{ 8U };
constexpr std::size_t g_kRecordHeaderBytes{ g_kNonceBytes + g_kAuthTagBytes };

using Nonce = std::array<std::uint8_t, g_kNonceBytes>;

// Non-owning view of `nonce || tag || payload`. Valid while the source bytes live.
struct CipherRecordView final
{
    std::span<const std::uint8_t, g_kNonceBytes> nonce;
    std::span<const std::uint8_t, g_kAuthTagBytes> tag;
    std::span<const std::uint8_t> payload;
};

// Writes the header and reserves the payload; the caller fills bytes [g_kRecordHeaderBytes, end).
[[nodiscard]] std::vector<std::uint8_t> makeRecordBuffer(const Nonce& nonce, std::size_t payloadBytes);

void writeRecordTag(std::span<std::uint8_t> record, const AuthTag& tag) noexcept;

// std::nullopt when the input is shorter than g_kRecordHeaderBytes.
[[nodiscard]] std::optional<CipherRecordView> parseRecord(std::span<const std::uint8_t> record) noexcept;

} // namespace symmorph::crypto

#endif // INCLUDE_SYMMORPH_CRYPTO_CIPHERRECORD_HPP
