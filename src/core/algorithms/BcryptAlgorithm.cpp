#include "credhash/core/BcryptAlgorithm.hpp"

#include "credhash/core/Encoder.hpp"
#include "credhash/core/Errors.hpp"
#include "credhash/core/ParameterStore.hpp"
#include "credhash/crypto/Bcrypt.hpp"
#include <stdexcept>
#include <string>
#include <variant>

namespace credhash::core
{

std::string_view BcryptAlgorithm::name() const noexcept
{
    return g_kBcryptName;
}

AlgorithmParameters BcryptAlgorithm::resolveParameters(const ParameterStore& store) const
{
    return store.resolveBcrypt();
}

std::string BcryptAlgorithm::encode(std::string_view password, const AlgorithmParameters& params) const
{
    const auto* bcrypt{ std::get_if<BcryptParameters>(&params) };
    if (bcrypt == nullptr)
    {
        throw std::invalid_argument("BcryptAlgorithm::encode: parameters for another algorithm");
    }

    if (!credhash::crypto::bcryptAcceptsPassword(password))
    {
        throw UnsupportedPasswordError{ "bcrypt accepts at most 72 bytes and no NUL", "password" };
    }

    std::string modular{};
    try
    {
        modular = credhash::crypto::bcryptHash(password, bcrypt->cost);
    }
    catch (const std::invalid_argument& e)
    {
        throw ConfigurationError{ e.what(), std::string{ g_kBcryptCostKey } };
    }
    catch (const std::runtime_error& e)
    {
        throw CryptoFailure{ e.what(), std::string{ g_kBcryptName } };
    }

    return formatBcrypt(*bcrypt, modular);
}

bool BcryptAlgorithm::verify(std::string_view password, const DecodedHash& decoded) const
{
    if (!std::holds_alternative<BcryptParameters>(decoded.parameters))
    {
        throw std::invalid_argument("BcryptAlgorithm::verify: decoded hash of another algorithm");
    }

    const std::string_view modular{ reinterpret_cast<const char*>(decoded.hash.data()), decoded.hash.size() };
    switch (credhash::crypto::bcryptCheck(password, modular))
    {
    case credhash::crypto::BcryptCheck::Match:
        return true;
    case credhash::crypto::BcryptCheck::Mismatch:
        return false;
    case credhash::crypto::BcryptCheck::InvalidHash:
        break;
    }
    throw FormatError{ "bcrypt rejected the stored hash", "hash" };
}

} // namespace credhash::core
