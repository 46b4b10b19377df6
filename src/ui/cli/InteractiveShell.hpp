#ifndef SYMMORPH_UI_CLI_INTERACTIVESHELL_HPP
#define SYMMORPH_UI_CLI_INTERACTIVESHELL_HPP

#include "ConsoleUtils.hpp"
#include "symmorph/crypto/SymmetricMorph.hpp"
#include "symmorph/security/SecureBuffer.hpp"

#include <cstddef>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>

namespace symmorph::ui::cli
{

// Line-oriented session holding at most one cipher. Ciphertext travels as hex records.
class InteractiveShell final
{
public:
    InteractiveShell(std::istream& in, std::ostream& out, PasswordReader pwdReader,
                     symmorph::crypto::SymmetricMorph::EntropyPtr entropy = nullptr);

    int run();

private:
    std::istream& m_in;
    std::ostream& m_out;
    PasswordReader m_pwdReader;
    symmorph::crypto::SymmetricMorph::EntropyPtr m_entropy;

    std::optional<symmorph::crypto::SymmetricMorph> m_cipher;
    symmorph::security::SecureBuffer m_salt;
    bool m_running{ true };

    void processLine(const std::string& line);

    [[nodiscard]] bool requireCipher();

    void doInit(std::uint32_t iterations, std::size_t keyBytes, const std::string& saltHex);
    void doKey(const std::string& keyHex);
    void doGenKey(std::size_t length);
    void doSalt();
    void doEncrypt(const std::string& text);
    void doDecrypt(const std::string& recordHex);
    void doClose();
};

} // namespace symmorph::ui::cli

#endif // SYMMORPH_UI_CLI_INTERACTIVESHELL_HPP
