#ifndef INCLUDE_CREDHASH_SECURITY_SECUREBUFFER_HPP
#define INCLUDE_CREDHASH_SECURITY_SECUREBUFFER_HPP

#include "credhash/security/ZeroAllocator.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace credhash::security
{

// Derived keys, salts and other byte strings that must not outlive their use.
using SecureBuffer = std::vector<std::uint8_t, ZeroAllocator<std::uint8_t>>;

[[nodiscard]] inline std::span<const std::uint8_t> asSpan(const SecureBuffer& b) noexcept
{
    return { b.data(), b.size() };
}

[[nodiscard]] inline std::span<const std::byte> asBytes(const SecureBuffer& b) noexcept
{
    return std::as_bytes(asSpan(b));
}

// Passwords reach the KDF as raw bytes; no terminator, no encoding step.
[[nodiscard]] inline std::span<const std::byte> asBytes(std::string_view s) noexcept
{
    return std::as_bytes(std::span<const char>{ s.data(), s.size() });
}

} // namespace credhash::security

#endif // INCLUDE_CREDHASH_SECURITY_SECUREBUFFER_HPP
