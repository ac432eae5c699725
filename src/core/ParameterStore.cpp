#include "credhash/core/ParameterStore.hpp"

#include "Decimal.hpp"
#include "credhash/core/Errors.hpp"
#include "credhash/crypto/Bcrypt.hpp"
#include "credhash/crypto/KdfParams.hpp"
#include <string>

namespace credhash::core
{

AlgorithmParameters ParameterStore::resolve(std::string_view algorithm) const
{
    if (algorithm == g_kArgon2idName)
    {
        return resolveArgon2id();
    }
    if (algorithm == g_kBcryptName)
    {
        return resolveBcrypt();
    }
    throw ConfigurationError{ "no built-in tunables for algorithm", std::string{ algorithm } };
}

Argon2idParameters ParameterStore::resolveArgon2id() const
{
    const auto parallelism{ requireUnsigned(g_kArgon2idParallelismKey, 1U, credhash::crypto::g_kArgon2MaxParallelism) };
    const auto memory{ requireUnsigned(g_kArgon2idMemoryKey, parallelism * credhash::crypto::g_kArgon2MinBlocksPerLane,
                                      credhash::crypto::g_kArgon2MaxMemoryKiB) };
    const auto iterations{ requireUnsigned(g_kArgon2idIterationsKey, 1U, credhash::crypto::g_kArgon2MaxIterations) };
    const auto saltLength{ requireUnsigned(g_kArgon2idSaltLengthKey, g_kMinSaltLength, g_kMaxSaltLength) };
    const auto keyLength{ requireUnsigned(g_kArgon2idKeyLengthKey, g_kMinKeyLength, g_kMaxKeyLength) };

    return Argon2idParameters{
        .memoryCostKiB = static_cast<std::uint32_t>(memory),
        .iterations = static_cast<std::uint32_t>(iterations),
        .parallelism = static_cast<std::uint8_t>(parallelism),
        .saltLength = static_cast<std::uint32_t>(saltLength),
        .keyLength = static_cast<std::uint32_t>(keyLength),
    };
}

BcryptParameters ParameterStore::resolveBcrypt() const
{
    const auto cost{ requireUnsigned(g_kBcryptCostKey, static_cast<std::uint64_t>(credhash::crypto::g_kBcryptMinCost),
                                    static_cast<std::uint64_t>(credhash::crypto::g_kBcryptMaxCost)) };
    return BcryptParameters{ .cost = static_cast<int>(cost) };
}

std::uint64_t ParameterStore::requireUnsigned(std::string_view key, std::uint64_t minValue, std::uint64_t maxValue) const
{
    const std::string name{ key };

    const auto raw{ m_source.value(key) };
    if (!raw.has_value())
    {
        throw ConfigurationError{ name + " is not set", name };
    }

    const auto parsed{ detail::parseCanonicalDecimal(*raw) };
    if (!parsed.has_value())
    {
        throw ConfigurationError{ name + " is not a non-negative integer", name };
    }

    if (*parsed < minValue || *parsed > maxValue)
    {
        throw ConfigurationError{ name + " must be in [" + std::to_string(minValue) + ", " + std::to_string(maxValue) +
                                      "]",
                                  name };
    }
    return *parsed;
}

} // namespace credhash::core
