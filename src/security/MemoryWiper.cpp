#include "credhash/security/MemoryWiper.hpp"

#include <atomic>

#if defined(_WIN32)
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#include <Windows.h>
#elif defined(__linux__) || defined(__FreeBSD__) || defined(__OpenBSD__)
#include <string.h>
#define CREDHASH_HAVE_EXPLICIT_BZERO 1
#endif

namespace credhash::security
{
#if !defined(_WIN32) && !defined(CREDHASH_HAVE_EXPLICIT_BZERO)
namespace
{

// Stores through a volatile pointer may not be dropped by the optimizer.
void volatileZero(std::byte* p, std::size_t n) noexcept
{
    volatile std::byte* cursor{ p };
    for (std::size_t i{}; i < n; ++i)
    {
        cursor[i] = std::byte{ 0 };
    }
}

} // namespace
#endif

void secureWipe(std::span<std::byte> bytes) noexcept
{
    if (bytes.empty())
    {
        return;
    }

#if defined(_WIN32)
    ::SecureZeroMemory(bytes.data(), bytes.size());
#elif defined(CREDHASH_HAVE_EXPLICIT_BZERO)
    ::explicit_bzero(bytes.data(), bytes.size());
#else
    volatileZero(bytes.data(), bytes.size());
#endif

    std::atomic_signal_fence(std::memory_order_seq_cst);
}

} // namespace credhash::security
