#include "symmorph/crypto/entropy/ClockEntropyFactory.hpp"

#include <chrono>
#include <stdexcept>
#include <utility>

namespace symmorph::crypto::entropy
{
namespace
{

const std::chrono::steady_clock::time_point g_processStart{ std::chrono::steady_clock::now() };

class ClockEntropySource final : public symmorph::crypto::EntropySource
{
public:
    ClockEntropySource(MillisProvider wallClock, MillisProvider uptime)
        : m_wallClock{ std::move(wallClock) }, m_uptime{ std::move(uptime) }
    {
    }

    [[nodiscard]] symmorph::crypto::Nonce nonce() const override
    {
        return symmorph::crypto::nonceFromMillis(m_wallClock());
    }

    [[nodiscard]] symmorph::security::SecureBuffer salt(std::size_t length) const override
    {
        return symmorph::crypto::saltFromUptime(m_uptime(), length);
    }

    [[nodiscard]] symmorph::security::SecureBuffer key(std::size_t length) const override
    {
        return symmorph::crypto::keyFromMillis(m_wallClock(), length);
    }

private:
    MillisProvider m_wallClock;
    MillisProvider m_uptime;
};

} // namespace

[[nodiscard]] std::uint64_t wallClockMillis() noexcept
{
    using Clock = std::chrono::system_clock;
    const auto millis{ std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now().time_since_epoch()) };
    const auto count{ millis.count() };
    if (count < 0)
    {
        return 0U;
    }
    return static_cast<std::uint64_t>(count);
}

[[nodiscard]] std::uint64_t uptimeMillis() noexcept
{
    const auto elapsed{ std::chrono::steady_clock::now() - g_processStart };
    const auto count{ std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count() };
    if (count < 0)
    {
        return 0U;
    }
    return static_cast<std::uint64_t>(count);
}

[[nodiscard]] std::shared_ptr<const symmorph::crypto::EntropySource> makeClockEntropySource(MillisProvider wallClock,
                                                                                            MillisProvider uptime)
{
    if (!wallClock || !uptime)
    {
        throw std::invalid_argument("makeClockEntropySource: missing clock");
    }
    return std::make_shared<ClockEntropySource>(std::move(wallClock), std::move(uptime));
}

} // namespace symmorph::crypto::entropy
