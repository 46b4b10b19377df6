#include "symmorph/crypto/entropy/SystemEntropyFactory.hpp"

#include "symmorph/security/SecureRandom.hpp"

#include <stdexcept>

namespace symmorph::crypto::entropy
{
namespace
{

void fillOrThrow(std::span<std::uint8_t> out, const char* what)
{
    if (!symmorph::security::secureRandomFill(out))
    {
        throw std::runtime_error(what);
    }
}

class SystemEntropySource final : public symmorph::crypto::EntropySource
{
public:
    [[nodiscard]] symmorph::crypto::Nonce nonce() const override
    {
        symmorph::crypto::Nonce out{};
        fillOrThrow(std::span<std::uint8_t>{ out }, "SystemEntropySource: nonce CSPRNG failure");
        return out;
    }

    [[nodiscard]] symmorph::security::SecureBuffer salt(std::size_t length) const override
    {
        symmorph::security::SecureBuffer out{};
        out.resize(length);
        fillOrThrow(std::span<std::uint8_t>{ out }, "SystemEntropySource: salt CSPRNG failure");
        return out;
    }

    [[nodiscard]] symmorph::security::SecureBuffer key(std::size_t length) const override
    {
        symmorph::security::SecureBuffer out{};
        out.resize(length);
        fillOrThrow(std::span<std::uint8_t>{ out }, "SystemEntropySource: key CSPRNG failure");
        return out;
    }
};

} // namespace

[[nodiscard]] std::shared_ptr<const symmorph::crypto::EntropySource> makeSystemEntropySource()
{
    return std::make_shared<SystemEntropySource>();
}

} // namespace symmorph::crypto::entropy
