#ifndef INCLUDE_CREDHASH_SECURITY_SECURESTRING_HPP
#define INCLUDE_CREDHASH_SECURITY_SECURESTRING_HPP

#include "credhash/security/ZeroAllocator.hpp"
#include <cstddef>
#include <span>
#include <string_view>
#include <vector>

namespace credhash::security
{

// Plaintext password as typed at the prompt. Not NUL-terminated.
using SecureString = std::vector<char, ZeroAllocator<char>>;

[[nodiscard]] inline SecureString secureStringFrom(std::string_view text)
{
    return SecureString(text.begin(), text.end()); // NOLINT(modernize-return-braced-init-list)
}

[[nodiscard]] inline std::string_view asStringView(const SecureString& s) noexcept
{
    return { s.data(), s.size() };
}

[[nodiscard]] inline std::span<std::byte> asWritableBytes(SecureString& s) noexcept
{
    return std::as_writable_bytes(std::span<char>{ s.data(), s.size() });
}

} // namespace credhash::security

#endif // INCLUDE_CREDHASH_SECURITY_SECURESTRING_HPP
