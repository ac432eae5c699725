#ifndef INCLUDE_CREDHASH_CORE_ALGORITHMPARAMETERS_HPP
#define INCLUDE_CREDHASH_CORE_ALGORITHMPARAMETERS_HPP

#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <variant>

namespace credhash::core
{

constexpr std::string_view g_kArgon2idName{ "argon2id" };
constexpr std::string_view g_kBcryptName{ "bcrypt" };

struct Argon2idParameters final
{
    std::uint32_t memoryCostKiB;
    std::uint32_t iterations;
    std::uint8_t parallelism;
    std::uint32_t saltLength{ 16U };
    std::uint32_t keyLength{ 32U };

    bool operator==(const Argon2idParameters&) const = default;
};

struct BcryptParameters final
{
    int cost;

    bool operator==(const BcryptParameters&) const = default;
};

// Named numeric tunables of an algorithm added to the registry outside the built-in set.
struct CustomParameters final
{
    std::map<std::string, std::uint64_t, std::less<>> values;

    bool operator==(const CustomParameters&) const = default;
};

// Value type, resolved per call and never shared between calls.
using AlgorithmParameters = std::variant<Argon2idParameters, BcryptParameters, CustomParameters>;

} // namespace credhash::core

#endif // INCLUDE_CREDHASH_CORE_ALGORITHMPARAMETERS_HPP
