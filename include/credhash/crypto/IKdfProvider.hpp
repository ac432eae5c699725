#ifndef INCLUDE_CREDHASH_CRYPTO_IKDFPROVIDER_HPP
#define INCLUDE_CREDHASH_CRYPTO_IKDFPROVIDER_HPP

#include "credhash/crypto/KdfParams.hpp"
#include "credhash/security/SecureBuffer.hpp"
#include <cstddef>
#include <span>
#include <string_view>

namespace credhash::crypto
{

class IKdfProvider
{
public:
    IKdfProvider() = default;
    IKdfProvider(const IKdfProvider&) = delete;
    IKdfProvider& operator=(const IKdfProvider&) = delete;
    IKdfProvider(IKdfProvider&&) = delete;
    IKdfProvider& operator=(IKdfProvider&&) = delete;
    virtual ~IKdfProvider() = default;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    // Argon2id v1.3 over (password, salt) producing outBytes of key material.
    // Must be safe to call concurrently; each call owns its scratch memory.
    // Parameters outside the Argon2 domain or the g_kArgon2Max* ceilings throw std::invalid_argument.
    // Backend failures throw std::runtime_error.
    [[nodiscard]] virtual credhash::security::SecureBuffer deriveArgon2id(std::span<const std::byte> password,
                                                                          std::span<const std::uint8_t> salt,
                                                                          Argon2idParams params,
                                                                          std::size_t outBytes) const = 0;
};

} // namespace credhash::crypto

#endif // INCLUDE_CREDHASH_CRYPTO_IKDFPROVIDER_HPP
