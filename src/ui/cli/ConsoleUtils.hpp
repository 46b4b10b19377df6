#ifndef SYMMORPH_UI_CLI_CONSOLEUTILS_HPP
#define SYMMORPH_UI_CLI_CONSOLEUTILS_HPP

#include "symmorph/security/SecureString.hpp"
#include <functional>
#include <string>

namespace symmorph::ui::cli
{

// In tests: returns a pre-determined string.
using PasswordReader = std::function<symmorph::security::SecureString(const std::string&)>;

void lockProcessMemory() noexcept;

// Prompts on stdout and reads one line from stdin with terminal echo disabled.
[[nodiscard]] symmorph::security::SecureString readPassword(const std::string& prompt);

} // namespace symmorph::ui::cli

#endif // SYMMORPH_UI_CLI_CONSOLEUTILS_HPP
