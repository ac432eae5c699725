#include "ConsoleUtils.hpp"

#include "credhash/security/MemoryWiper.hpp"
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

namespace credhash::ui::cli
{
namespace
{

// Turns echo off for its lifetime; restores the previous mode even if reading throws.
class EchoOffGuard final
{
public:
    EchoOffGuard() noexcept
    {
#if defined(_WIN32)
        m_handle = GetStdHandle(STD_INPUT_HANDLE);
        if (GetConsoleMode(m_handle, &m_saved) != 0)
        {
            m_active = SetConsoleMode(m_handle, m_saved & ~static_cast<DWORD>(ENABLE_ECHO_INPUT)) != 0;
        }
#else
        if (::isatty(STDIN_FILENO) == 1 && ::tcgetattr(STDIN_FILENO, &m_saved) == 0)
        {
            struct termios silent
            {
                m_saved
            };
            silent.c_lflag &= ~static_cast<tcflag_t>(ECHO);
            m_active = ::tcsetattr(STDIN_FILENO, TCSANOW, &silent) == 0;
        }
#endif
    }

    EchoOffGuard(const EchoOffGuard&) = delete;
    EchoOffGuard& operator=(const EchoOffGuard&) = delete;
    EchoOffGuard(EchoOffGuard&&) = delete;
    EchoOffGuard& operator=(EchoOffGuard&&) = delete;

    ~EchoOffGuard() noexcept
    {
        if (!m_active)
        {
            return;
        }
#if defined(_WIN32)
        SetConsoleMode(m_handle, m_saved);
#else
        ::tcsetattr(STDIN_FILENO, TCSANOW, &m_saved);
#endif
    }

private:
#if defined(_WIN32)
    HANDLE m_handle{ nullptr };
    DWORD m_saved{ 0 };
#else
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
    (void)::mlockall(MCL_CURRENT | MCL_FUTURE);
    const struct rlimit noCore
    {
        0, 0
    };
    (void)::setrlimit(RLIMIT_CORE, &noCore);
#endif
}

credhash::security::SecureString readPassword(std::string_view prompt, std::istream& in, std::ostream& out)
{
    out << prompt << std::flush;

    std::string line{};
    {
        const bool console{ &in == &std::cin };
        if (console)
        {
            const EchoOffGuard guard{};
            std::getline(in, line);
        }
        else
        {
            std::getline(in, line);
        }
    }
    out << "\n";

    auto secret{ credhash::security::secureStringFrom(line) };
    credhash::security::secureWipe(line);
    return secret;
}

} // namespace credhash::ui::cli
