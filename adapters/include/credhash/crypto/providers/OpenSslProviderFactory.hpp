#ifndef INCLUDE_CREDHASH_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP
#define INCLUDE_CREDHASH_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP

#include "credhash/crypto/IKdfProvider.hpp"
#include <memory>

namespace credhash::crypto::providers
{

// Needs an OpenSSL build that ships the ARGON2ID KDF (3.2+). On older builds the
// provider still constructs; deriveArgon2id then throws std::runtime_error.
[[nodiscard]] std::unique_ptr<credhash::crypto::IKdfProvider> makeOpenSslKdfProvider();

} // namespace credhash::crypto::providers

#endif // INCLUDE_CREDHASH_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP
