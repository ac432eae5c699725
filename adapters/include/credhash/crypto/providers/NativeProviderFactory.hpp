#ifndef INCLUDE_CREDHASH_CRYPTO_PROVIDERS_NATIVEPROVIDERFACTORY_HPP
#define INCLUDE_CREDHASH_CRYPTO_PROVIDERS_NATIVEPROVIDERFACTORY_HPP

#include "credhash/crypto/IKdfProvider.hpp"
#include <memory>

namespace credhash::crypto::providers
{

[[nodiscard]] std::unique_ptr<credhash::crypto::IKdfProvider> makeNativeKdfProvider();

} // namespace credhash::crypto::providers

#endif // INCLUDE_CREDHASH_CRYPTO_PROVIDERS_NATIVEPROVIDERFACTORY_HPP
