#include "InteractiveShell.hpp"
#include "Hex.hpp"
#include "Tokenizer.hpp"
#include "symmorph/crypto/entropy/ClockEntropyFactory.hpp"
#include "symmorph/security/ScopeWipe.hpp"

#include <CLI/CLI.hpp>
#include <span>
#include <stdexcept>
#include <string_view>
#include <variant>
#include <vector>

namespace symmorph::ui::cli
{

InteractiveShell::InteractiveShell(std::istream& in, std::ostream& out, PasswordReader pwdReader,
                                   symmorph::crypto::SymmetricMorph::EntropyPtr entropy)
    : m_in(in), m_out(out), m_pwdReader(std::move(pwdReader)),
      m_entropy(entropy ? std::move(entropy) : symmorph::crypto::entropy::makeClockEntropySource())
{
}

int InteractiveShell::run()
{
    m_out << "SymmetricMorph shell (CLI11 Powered)\n";
    m_out << "Type 'help' for available commands.\n";

    std::string line;
    while (m_running && m_in.good())
    {
        m_out << (m_cipher.has_value() ? "symm*> " : "symm> ");

        if (!std::getline(m_in, line))
        {
            break; // EOF
        }

        if (line.empty())
        {
            continue;
        }

        processLine(line);
    }
    return 0;
}

void InteractiveShell::processLine(const std::string& line)
{
    std::vector<std::string> userArgs = Tokenizer::tokenize(line);

    if (userArgs.empty())
    {
        return;
    }

    // 'help' prints the root help rather than the help of the 'help' subcommand.
    if (userArgs[0] == "help")
    {
        userArgs[0] = "--help";
    }

    std::vector<std::string> args;
    args.reserve(userArgs.size() + 1);
    args.emplace_back("symm");
    args.insert(args.end(), userArgs.begin(), userArgs.end());

    CLI::App app{ "SymmetricMorph Shell" };
    app.require_subcommand(1);

    app.add_subcommand("help", "Print this help message")->callback([]() { throw CLI::CallForHelp(); });

    app.add_subcommand("exit", "Exit the shell")->alias("quit")->callback([this]() { m_running = false; });

    // INIT
    std::uint32_t iterations{ symmorph::crypto::g_kDefaultKdfIterations };
    std::size_t keyBytes{ symmorph::crypto::g_kDefaultKeyBytes };
    std::string saltHex;
    auto* subInit = app.add_subcommand("init", "Derive a cipher from a password (prompts)");
    subInit->add_option("--iterations", iterations, "Key derivation rounds")->check(CLI::PositiveNumber);
    subInit->add_option("--key-length", keyBytes, "Derived key length in bytes")->check(CLI::PositiveNumber);
    subInit->add_option("--salt", saltHex, "Reuse a salt (hex) instead of generating one");
    subInit->callback([&]() { doInit(iterations, keyBytes, saltHex); });

    // KEY
    std::string hexArg;
    auto* subKey = app.add_subcommand("key", "Bind a raw key given as hex");
    subKey->add_option("hex", hexArg, "Key bytes")->required();
    subKey->callback([&]() { doKey(hexArg); });

    // GENKEY
    std::size_t length{ symmorph::crypto::g_kDefaultKeyBytes };
    auto* subGenKey = app.add_subcommand("genkey", "Print a generated raw key");
    subGenKey->add_option("length", length, "Key length in bytes")->check(CLI::Range(1, 4096));
    subGenKey->callback([&]() { doGenKey(length); });

    app.add_subcommand("salt", "Print the salt of the current password cipher")->callback([this]() { doSalt(); });

    // ENCRYPT
    std::string textArg;
    auto* subEncrypt = app.add_subcommand("encrypt", "Encrypt text, print the record as hex");
    subEncrypt->add_option("text", textArg, "Plaintext")->required();
    subEncrypt->callback([&]() { doEncrypt(textArg); });

    // DECRYPT
    auto* subDecrypt = app.add_subcommand("decrypt", "Decrypt a hex record, print the text");
    subDecrypt->add_option("hex", hexArg, "Record bytes")->required();
    subDecrypt->callback([&]() { doDecrypt(hexArg); });

    app.add_subcommand("close", "Drop the current cipher")->callback([this]() { doClose(); });

    try
    {
        std::vector<char*> argv;
        argv.reserve(args.size());
        for (const auto& arg : args)
        {
            argv.push_back(const_cast<char*>(arg.c_str()));
        }

        app.parse(static_cast<int>(argv.size()), argv.data());
    }
    catch ([[maybe_unused]] const CLI::CallForHelp&)
    {
        m_out << app.help();
    }
    catch (const CLI::ParseError& e)
    {
        m_out << "Syntax Error: " << e.what() << "\n";
    }
}

// --- Handlers ---

bool InteractiveShell::requireCipher()
{
    if (!m_cipher.has_value())
    {
        m_out << "Error: No cipher initialised.\n";
        return false;
    }
    return true;
}

void InteractiveShell::doInit(std::uint32_t iterations, std::size_t keyBytes, const std::string& saltHex)
{
    std::optional<symmorph::security::SecureBuffer> salt{};
    if (!saltHex.empty())
    {
        salt = parseHex(saltHex);
        if (!salt)
        {
            m_out << "Error: Salt must be hex.\n";
            return;
        }
    }

    auto pass = m_pwdReader("Password: ");
    auto wipePass = symmorph::security::scopeWipe(pass);
    if (pass.empty())
    {
        m_out << "Error: Empty password.\n";
        return;
    }

    const symmorph::crypto::KdfParams params{ .iterations = iterations, .keyBytes = keyBytes };
    try
    {
        if (salt)
        {
            m_cipher.emplace(symmorph::crypto::SymmetricMorph::fromPasswordWithSalt(
                symmorph::security::asBytes(pass), symmorph::security::asSpan(*salt), params, m_entropy));
            m_salt = std::move(*salt);
        }
        else
        {
            auto derived = symmorph::crypto::SymmetricMorph::fromPassword(symmorph::security::asBytes(pass), params,
                                                                          m_entropy);
            m_cipher.emplace(std::move(derived.cipher));
            m_salt = std::move(derived.salt);
        }
    }
    catch (const std::invalid_argument& e)
    {
        m_out << "Error: " << e.what() << "\n";
        return;
    }
    m_out << "Ready.\n";
}

void InteractiveShell::doKey(const std::string& keyHex)
{
    auto key = parseHex(keyHex);
    if (!key || key->empty())
    {
        m_out << "Error: Key must be non-empty hex.\n";
        return;
    }
    m_cipher.emplace(symmorph::crypto::SymmetricMorph::fromKey(symmorph::security::asSpan(*key), m_entropy));
    symmorph::security::secureRelease(m_salt);
    m_out << "Ready.\n";
}

void InteractiveShell::doGenKey(std::size_t length)
{
    auto key = symmorph::crypto::SymmetricMorph::generateKey(length, m_entropy);
    auto wipeKey = symmorph::security::scopeWipe(key);
    m_out << toHex(symmorph::security::asSpan(key)) << "\n";
}

void InteractiveShell::doSalt()
{
    if (!requireCipher())
    {
        return;
    }
    if (m_salt.empty())
    {
        m_out << "(raw key, no salt)\n";
        return;
    }
    m_out << toHex(symmorph::security::asSpan(m_salt)) << "\n";
}

void InteractiveShell::doEncrypt(const std::string& text)
{
    if (!requireCipher())
    {
        return;
    }
    const auto* begin = reinterpret_cast<const std::uint8_t*>(text.data());
    const auto record = m_cipher->encrypt(std::span<const std::uint8_t>{ begin, text.size() });
    m_out << toHex(record) << "\n";
}

void InteractiveShell::doDecrypt(const std::string& recordHex)
{
    if (!requireCipher())
    {
        return;
    }
    const auto record = parseHex(recordHex);
    if (!record)
    {
        m_out << "Error: Record must be hex.\n";
        return;
    }

    auto result = m_cipher->decrypt(symmorph::security::asSpan(*record));
    if (const auto* error = std::get_if<symmorph::crypto::CipherError>(&result))
    {
        m_out << "Error: " << symmorph::crypto::describe(*error) << "\n";
        return;
    }

    auto& plain = std::get<symmorph::security::SecureBuffer>(result);
    auto wipePlain = symmorph::security::scopeWipe(plain);
    m_out << std::string_view{ reinterpret_cast<const char*>(plain.data()), plain.size() } << "\n";
}

void InteractiveShell::doClose()
{
    if (!requireCipher())
    {
        return;
    }
    m_cipher.reset();
    symmorph::security::secureRelease(m_salt);
    m_out << "Cipher closed.\n";
}

} // namespace symmorph::ui::cli
