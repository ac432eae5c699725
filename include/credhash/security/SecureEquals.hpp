#ifndef INCLUDE_CREDHASH_SECURITY_SECUREEQUALS_HPP
#define INCLUDE_CREDHASH_SECURITY_SECUREEQUALS_HPP

#include "credhash/security/SecureBuffer.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

namespace credhash::security
{

// Constant-time equality. Runs over the longer input in full; a length mismatch
// is folded into the accumulator instead of returning early, so the timing only
// depends on the lengths, never on where the first differing byte sits.
[[nodiscard]] inline bool secureEquals(std::span<const std::byte> a, std::span<const std::byte> b) noexcept
{
    const std::size_t n{ (a.size() > b.size()) ? a.size() : b.size() };

    volatile std::size_t diff{ a.size() ^ b.size() };
    for (std::size_t i{}; i < n; ++i)
    {
        const unsigned char x{ (i < a.size()) ? std::to_integer<unsigned char>(a[i]) : static_cast<unsigned char>(0U) };
        const unsigned char y{ (i < b.size()) ? std::to_integer<unsigned char>(b[i]) : static_cast<unsigned char>(0U) };
        diff = diff | static_cast<std::size_t>(x ^ y);
    }

    return (diff == 0U);
}

[[nodiscard]] inline bool secureEquals(std::span<const std::uint8_t> a, std::span<const std::uint8_t> b) noexcept
{
    return secureEquals(std::as_bytes(a), std::as_bytes(b));
}

[[nodiscard]] inline bool secureEquals(const SecureBuffer& a, const SecureBuffer& b) noexcept
{
    return secureEquals(asBytes(a), asBytes(b));
}

[[nodiscard]] inline bool secureEquals(std::string_view a, std::string_view b) noexcept
{
    return secureEquals(asBytes(a), asBytes(b));
}

} // namespace credhash::security

#endif // INCLUDE_CREDHASH_SECURITY_SECUREEQUALS_HPP
