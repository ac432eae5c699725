#include "credhash/security/SecureRandom.hpp"
#include <cerrno>
#include <cstddef>
#include <limits>

#if defined(_WIN32)
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#include <Windows.h>
#include <bcrypt.h>
#elif defined(__linux__)
#include <sys/random.h>
#else
#include <unistd.h>
#endif

namespace credhash::security
{
namespace
{

// Requests at most this many bytes per system call.
#if defined(_WIN32)
constexpr std::size_t g_kMaxDraw{ static_cast<std::size_t>(std::numeric_limits<ULONG>::max()) };
#else
// getrandom(2) does not return short for requests up to 256 bytes; getentropy(3) refuses more.
constexpr std::size_t g_kMaxDraw{ 256U };
#endif

// Fills chunk entirely or reports failure. EINTR is retried.
[[nodiscard]] bool drawChunk(std::span<std::uint8_t> chunk) noexcept
{
#if defined(_WIN32)
    return BCRYPT_SUCCESS(BCryptGenRandom(nullptr, reinterpret_cast<PUCHAR>(chunk.data()),
                                          static_cast<ULONG>(chunk.size()), BCRYPT_USE_SYSTEM_PREFERRED_RNG));
#elif defined(__linux__)
    std::size_t filled{};
    while (filled < chunk.size())
    {
        const ssize_t got{ ::getrandom(chunk.data() + filled, chunk.size() - filled, 0) };
        if (got < 0 && errno == EINTR)
        {
            continue;
        }
        if (got <= 0)
        {
            return false;
        }
        filled += static_cast<std::size_t>(got);
    }
    return true;
#else
    return ::getentropy(chunk.data(), chunk.size()) == 0;
#endif
}

} // namespace

bool secureRandomFill(std::span<std::uint8_t> out) noexcept
{
    while (!out.empty())
    {
        const std::size_t n{ (out.size() < g_kMaxDraw) ? out.size() : g_kMaxDraw };
        if (!drawChunk(out.first(n)))
        {
            return false;
        }
        out = out.subspan(n);
    }
    return true;
}

std::optional<SecureBuffer> secureRandomBytes(std::size_t count)
{
    SecureBuffer out(count);
    if (!secureRandomFill(std::span<std::uint8_t>{ out.data(), out.size() }))
    {
        return std::nullopt;
    }
    return out;
}

} // namespace credhash::security
