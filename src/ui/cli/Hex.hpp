#ifndef SYMMORPH_UI_CLI_HEX_HPP
#define SYMMORPH_UI_CLI_HEX_HPP

#include "symmorph/security/SecureBuffer.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace symmorph::ui::cli
{

[[nodiscard]] std::string toHex(std::span<const std::uint8_t> bytes);

// Accepts upper or lower case. std::nullopt on odd length or a non-hex digit.
[[nodiscard]] std::optional<symmorph::security::SecureBuffer> parseHex(std::string_view text);

} // namespace symmorph::ui::cli

#endif // SYMMORPH_UI_CLI_HEX_HPP
