#include "ConsoleUtils.hpp"

#include <iostream>
#include <string>

#if defined(_WIN32)
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#include <Windows.h>
#elif defined(__linux__)
#include <sys/mman.h>
#include <sys/resource.h>
#include <termios.h>
#include <unistd.h>
#else
#error "Unsupported platform"
#endif

namespace symmorph::ui::cli
{

namespace
{

// Restores the terminal echo state captured at construction.
class EchoGuard final
{
public:
    EchoGuard() noexcept
    {
#if defined(_WIN32)
        m_handle = GetStdHandle(STD_INPUT_HANDLE);
        m_active = GetConsoleMode(m_handle, &m_mode) != 0;
        if (m_active)
        {
            SetConsoleMode(m_handle, m_mode & ~ENABLE_ECHO_INPUT);
        }
#elif defined(__linux__)
        m_active = (isatty(STDIN_FILENO) == 1) && (tcgetattr(STDIN_FILENO, &m_saved) == 0);
        if (m_active)
        {
            struct termios quiet = m_saved;
            quiet.c_lflag &= ~static_cast<tcflag_t>(ECHO);
            tcsetattr(STDIN_FILENO, TCSANOW, &quiet);
        }
#endif
    }

    EchoGuard(const EchoGuard&) = delete;
    EchoGuard& operator=(const EchoGuard&) = delete;

    ~EchoGuard() noexcept
    {
        if (!m_active)
        {
            return;
        }
#if defined(_WIN32)
        SetConsoleMode(m_handle, m_mode);
#elif defined(__linux__)
        tcsetattr(STDIN_FILENO, TCSANOW, &m_saved);
#endif
    }

private:
#if defined(_WIN32)
    HANDLE m_handle{};
    DWORD m_mode{ 0 };
#elif defined(__linux__)
    struct termios m_saved
    {
    };
#endif
    bool m_active{ false };
};

} // namespace

void lockProcessMemory() noexcept
{
#if defined(__linux__)
    // Best effort: without CAP_IPC_LOCK or a raised RLIMIT_MEMLOCK this fails and keys may be swapped.
    (void)mlockall(MCL_CURRENT | MCL_FUTURE);
    struct rlimit lim
    {
        0, 0
    };
    (void)setrlimit(RLIMIT_CORE, &lim);
#endif
}

symmorph::security::SecureString readPassword(const std::string& prompt)
{
    std::cout << prompt << std::flush;

    std::string line;
    {
        EchoGuard quiet{};
        std::getline(std::cin, line);
    }
    std::cout << "\n";

    auto sec = symmorph::security::secureStringFrom(line);

    if (!line.empty())
    {
        volatile char* p = line.data();
        const std::size_t n = line.size();
        for (std::size_t i = 0; i < n; ++i)
        {
            p[i] = '\0';
        }
    }

    return sec;
}

} // namespace symmorph::ui::cli
