#ifndef INCLUDE_CREDHASH_CRYPTO_KEYDERIVATION_HPP
#define INCLUDE_CREDHASH_CRYPTO_KEYDERIVATION_HPP

#include "credhash/crypto/KdfParams.hpp"
#include "credhash/security/SecureBuffer.hpp"
#include <cstddef>
#include <span>

namespace credhash::crypto
{

// Shared precondition check for every Argon2id backend.
void requireArgon2idInputsSafe(std::span<const std::byte> password, std::span<const std::uint8_t> salt,
                               Argon2idParams params, std::size_t outBytes);

// Monocypher backend.
[[nodiscard]] credhash::security::SecureBuffer deriveArgon2id(std::span<const std::byte> password,
                                                              std::span<const std::uint8_t> salt,
                                                              Argon2idParams params, std::size_t outBytes);

} // namespace credhash::crypto

#endif // INCLUDE_CREDHASH_CRYPTO_KEYDERIVATION_HPP
