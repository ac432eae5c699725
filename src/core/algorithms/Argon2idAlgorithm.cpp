#include "credhash/core/Argon2idAlgorithm.hpp"

#include "credhash/core/Encoder.hpp"
#include "credhash/core/Errors.hpp"
#include "credhash/core/ParameterStore.hpp"
#include "credhash/security/SecureBuffer.hpp"
#include "credhash/security/SecureEquals.hpp"
#include "credhash/security/SecureRandom.hpp"
#include <span>
#include <stdexcept>
#include <string>
#include <variant>

namespace credhash::core
{
namespace
{

[[nodiscard]] credhash::crypto::Argon2idParams kdfParams(const Argon2idParameters& params) noexcept
{
    return credhash::crypto::Argon2idParams{ .iterations = params.iterations,
                                             .memoryKiB = params.memoryCostKiB,
                                             .parallelism = params.parallelism };
}

} // namespace

std::string_view Argon2idAlgorithm::name() const noexcept
{
    return g_kArgon2idName;
}

AlgorithmParameters Argon2idAlgorithm::resolveParameters(const ParameterStore& store) const
{
    return store.resolveArgon2id();
}

std::string Argon2idAlgorithm::encode(std::string_view password, const AlgorithmParameters& params) const
{
    const auto* argon{ std::get_if<Argon2idParameters>(&params) };
    if (argon == nullptr)
    {
        throw std::invalid_argument("Argon2idAlgorithm::encode: parameters for another algorithm");
    }

    const auto salt{ credhash::security::secureRandomBytes(argon->saltLength) };
    if (!salt.has_value())
    {
        throw CryptoFailure{ "secure random source failed", "salt" };
    }

    credhash::security::SecureBuffer key{};
    try
    {
        key = m_kdf.deriveArgon2id(credhash::security::asBytes(password), credhash::security::asSpan(*salt),
                                   kdfParams(*argon), argon->keyLength);
    }
    catch (const std::invalid_argument& e)
    {
        throw ConfigurationError{ e.what(), std::string{ g_kArgon2idName } };
    }
    catch (const std::runtime_error& e)
    {
        throw CryptoFailure{ e.what(), std::string{ g_kArgon2idName } };
    }

    return formatArgon2id(*argon, credhash::security::asSpan(*salt), credhash::security::asSpan(key));
}

bool Argon2idAlgorithm::verify(std::string_view password, const DecodedHash& decoded) const
{
    const auto* argon{ std::get_if<Argon2idParameters>(&decoded.parameters) };
    if (argon == nullptr)
    {
        throw std::invalid_argument("Argon2idAlgorithm::verify: decoded hash of another algorithm");
    }

    credhash::security::SecureBuffer candidate{};
    try
    {
        candidate = m_kdf.deriveArgon2id(credhash::security::asBytes(password), decoded.salt, kdfParams(*argon),
                                         decoded.hash.size());
    }
    catch (const std::invalid_argument& e)
    {
        throw FormatError{ e.what(), std::string{ g_kArgon2idName } };
    }
    catch (const std::runtime_error& e)
    {
        throw CryptoFailure{ e.what(), std::string{ g_kArgon2idName } };
    }

    return credhash::security::secureEquals(credhash::security::asSpan(candidate), std::span{ decoded.hash });
}

} // namespace credhash::core
