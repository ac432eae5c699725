#ifndef INCLUDE_CREDHASH_SECURITY_MEMORYWIPER_HPP
#define INCLUDE_CREDHASH_SECURITY_MEMORYWIPER_HPP

#include <cstddef>
#include <span>
#include <string>
#include <type_traits>

namespace credhash::security
{

// Zeroes memory in a way the optimizer may not elide.
void secureWipe(std::span<std::byte> bytes) noexcept;

template <typename T>
    requires(!std::is_const_v<T> && std::is_trivially_copyable_v<T>)
void secureWipe(std::span<T> buffer) noexcept
{
    secureWipe(std::as_writable_bytes(buffer));
}

// For std::string temporaries that held a password (CLI input, test fixtures).
inline void secureWipe(std::string& s) noexcept
{
    secureWipe(std::span<char>{ s.data(), s.size() });
    s.clear();
}

} // namespace credhash::security

#endif // INCLUDE_CREDHASH_SECURITY_MEMORYWIPER_HPP
