#include "ConsoleUtils.hpp"
#include "FileCommands.hpp"
#include "InteractiveShell.hpp"

#include "symmorph/crypto/entropy/ClockEntropyFactory.hpp"
#include "symmorph/crypto/entropy/SystemEntropyFactory.hpp"

#include <CLI/CLI.hpp>
#include <cstddef>
#include <exception>
#include <iostream>
#include <string>

namespace
{

[[nodiscard]] symmorph::crypto::SymmetricMorph::EntropyPtr selectEntropy(bool useSystem)
{
    if (useSystem)
    {
        return symmorph::crypto::entropy::makeSystemEntropySource();
    }
    return symmorph::crypto::entropy::makeClockEntropySource();
}

void addKeyOptions(CLI::App& sub, symmorph::ui::cli::KeyOptions& key)
{
    auto* pwd = sub.add_flag("-p,--password", key.usePassword, "Derive the key from a prompted password");
    auto* hex = sub.add_option("-k,--key-hex", key.keyHex, "Raw key as hex");
    pwd->excludes(hex);
    hex->excludes(pwd);
}

} // namespace

int main(int argc, char** argv)
{
    using namespace symmorph::ui::cli;

    try
    {
        lockProcessMemory();

        CLI::App app{ "SymmetricMorph: authenticated byte-stream cipher" };
        app.require_subcommand(1);

        bool systemEntropy{ false };
        app.add_flag("--system-entropy", systemEntropy, "Draw nonces, salts and keys from the OS CSPRNG");

        // KEYGEN
        std::size_t keyLength{ symmorph::crypto::g_kDefaultKeyBytes };
        auto* subKeygen = app.add_subcommand("keygen", "Print a generated raw key as hex");
        subKeygen->add_option("-l,--length", keyLength, "Key length in bytes")->check(CLI::Range(1, 65536));

        // ENCRYPT
        EncryptFileOptions encOpts{};
        auto* subEncrypt = app.add_subcommand("encrypt", "Encrypt a file into a chunk container");
        subEncrypt->add_option("input", encOpts.input, "Plaintext file")->required();
        subEncrypt->add_option("output", encOpts.output, "Container file")->required();
        addKeyOptions(*subEncrypt, encOpts.key);
        subEncrypt->add_option("--iterations", encOpts.iterations, "Key derivation rounds")
            ->check(CLI::Range(1U, symmorph::crypto::g_kMaxKdfIterations));
        subEncrypt->add_option("--key-length", encOpts.keyBytes, "Derived key length in bytes")
            ->check(CLI::Range(std::size_t{ 1U }, symmorph::crypto::g_kMaxKeyBytes));
        subEncrypt->add_option("--chunk-size", encOpts.chunkBytes, "Plaintext bytes per record")
            ->check(CLI::PositiveNumber);
        subEncrypt->add_option("-j,--jobs", encOpts.jobs, "Worker threads")->check(CLI::Range(1, 256));

        // DECRYPT
        DecryptFileOptions decOpts{};
        auto* subDecrypt = app.add_subcommand("decrypt", "Decrypt a chunk container");
        subDecrypt->add_option("input", decOpts.input, "Container file")->required();
        subDecrypt->add_option("output", decOpts.output, "Plaintext file")->required();
        addKeyOptions(*subDecrypt, decOpts.key);
        subDecrypt->add_option("-j,--jobs", decOpts.jobs, "Worker threads")->check(CLI::Range(1, 256));

        auto* subShell = app.add_subcommand("shell", "Interactive session");

        CLI11_PARSE(app, argc, argv);

        const auto entropy{ selectEntropy(systemEntropy) };

        if (subKeygen->parsed())
        {
            return runKeygen(keyLength, entropy, std::cout, std::cerr);
        }
        if (subEncrypt->parsed())
        {
            return runEncryptFile(encOpts, readPassword, entropy, std::cerr);
        }
        if (subDecrypt->parsed())
        {
            return runDecryptFile(decOpts, readPassword, std::cerr);
        }
        if (subShell->parsed())
        {
            InteractiveShell shell{ std::cin, std::cout, readPassword, entropy };
            return shell.run();
        }
        return g_kExitUsage;
    }
    catch (const std::exception& e)
    {
        std::cerr << "fatal: " << e.what() << '\n';
        return 1;
    }
}
