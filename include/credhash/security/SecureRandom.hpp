#ifndef INCLUDE_CREDHASH_SECURITY_SECURERANDOM_HPP
#define INCLUDE_CREDHASH_SECURITY_SECURERANDOM_HPP

#include "credhash/security/SecureBuffer.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

namespace credhash::security
{

// Fills from the OS CSPRNG. No handle is kept open between calls.
[[nodiscard]] bool secureRandomFill(std::span<std::uint8_t> out) noexcept;

// Returns std::nullopt when the entropy source fails.
[[nodiscard]] std::optional<SecureBuffer> secureRandomBytes(std::size_t count);

} // namespace credhash::security

#endif // INCLUDE_CREDHASH_SECURITY_SECURERANDOM_HPP
