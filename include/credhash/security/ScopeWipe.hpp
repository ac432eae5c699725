#ifndef INCLUDE_CREDHASH_SECURITY_SCOPEWIPE_HPP
#define INCLUDE_CREDHASH_SECURITY_SCOPEWIPE_HPP

#include "credhash/security/MemoryWiper.hpp"
#include "credhash/security/SecureBuffer.hpp"
#include "credhash/security/SecureString.hpp"
#include <cstdint>
#include <span>
#include <string>

namespace credhash::security
{

// Wipes a borrowed region when the enclosing scope unwinds, including by exception.
class [[nodiscard]] ScopeWipe final
{
public:
    explicit ScopeWipe(std::span<std::byte> bytes) noexcept : m_bytes{ bytes }
    {
    }

    ScopeWipe(const ScopeWipe&) = delete;
    ScopeWipe& operator=(const ScopeWipe&) = delete;
    ScopeWipe(ScopeWipe&&) = delete;
    ScopeWipe& operator=(ScopeWipe&&) = delete;

    ~ScopeWipe() noexcept
    {
        secureWipe(m_bytes);
    }

private:
    std::span<std::byte> m_bytes;
};

[[nodiscard]] inline ScopeWipe scopeWipe(std::span<std::uint8_t> b) noexcept
{
    return ScopeWipe{ std::as_writable_bytes(b) };
}

[[nodiscard]] inline ScopeWipe scopeWipe(SecureString& s) noexcept
{
    return ScopeWipe{ asWritableBytes(s) };
}

[[nodiscard]] inline ScopeWipe scopeWipe(std::string& s) noexcept
{
    return ScopeWipe{ std::as_writable_bytes(std::span<char>{ s.data(), s.size() }) };
}

} // namespace credhash::security

#endif // INCLUDE_CREDHASH_SECURITY_SCOPEWIPE_HPP
