#ifndef INCLUDE_CREDHASH_CORE_PARAMETERSTORE_HPP
#define INCLUDE_CREDHASH_CORE_PARAMETERSTORE_HPP

#include "credhash/core/AlgorithmParameters.hpp"
#include "credhash/core/ConfigSource.hpp"
#include <cstdint>
#include <string_view>

namespace credhash::core
{

constexpr std::string_view g_kArgon2idMemoryKey{ "ARGON2ID_MEMORY" };
constexpr std::string_view g_kArgon2idIterationsKey{ "ARGON2ID_ITERATIONS" };
constexpr std::string_view g_kArgon2idParallelismKey{ "ARGON2ID_PARALLELISM" };
constexpr std::string_view g_kArgon2idSaltLengthKey{ "ARGON2ID_SALT_LENGTH" };
constexpr std::string_view g_kArgon2idKeyLengthKey{ "ARGON2ID_KEY_LENGTH" };
constexpr std::string_view g_kBcryptCostKey{ "BCRYPT_COST" };

constexpr std::uint32_t g_kMinSaltLength{ 8U };
constexpr std::uint32_t g_kMaxSaltLength{ 64U };
constexpr std::uint32_t g_kMinKeyLength{ 16U };
constexpr std::uint32_t g_kMaxKeyLength{ 128U };

// Resolves tunables from configuration on every call; nothing is cached, so a change
// in the source is picked up by the next encode. All values are required.
class ParameterStore final
{
public:
    explicit ParameterStore(const ConfigSource& source) noexcept : m_source{ source }
    {
    }

    // Built-in algorithms only. Registry entries resolve through PasswordAlgorithm::resolveParameters.
    // ConfigurationError for a name without built-in tunables or a bad value.
    [[nodiscard]] AlgorithmParameters resolve(std::string_view algorithm) const;

    [[nodiscard]] Argon2idParameters resolveArgon2id() const;
    [[nodiscard]] BcryptParameters resolveBcrypt() const;

    // One required canonical decimal in [minValue, maxValue].
    [[nodiscard]] std::uint64_t requireUnsigned(std::string_view key, std::uint64_t minValue,
                                                std::uint64_t maxValue) const;

private:

    const ConfigSource& m_source;
};

} // namespace credhash::core

#endif // INCLUDE_CREDHASH_CORE_PARAMETERSTORE_HPP
