#ifndef INCLUDE_CREDHASH_CORE_ENCODER_HPP
#define INCLUDE_CREDHASH_CORE_ENCODER_HPP

#include "credhash/core/AlgorithmParameters.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace credhash::core
{

class AlgorithmRegistry;
class ParameterStore;

// $argon2id$v=19,m=<m>,t=<t>,p=<p>$<salt>$<hash>
[[nodiscard]] std::string formatArgon2id(const Argon2idParameters& params, std::span<const std::uint8_t> salt,
                                         std::span<const std::uint8_t> hash);

// $bcrypt$c=<cost>$<base64 of the modular crypt string>
[[nodiscard]] std::string formatBcrypt(const BcryptParameters& params, std::string_view modularHash);

class Encoder final
{
public:
    Encoder(const AlgorithmRegistry& registry, const ParameterStore& store) noexcept
        : m_registry{ registry }, m_store{ store }
    {
    }

    // Parameters are resolved afresh on every call. Output differs between calls
    // (fresh salt), so only its structure and verifiability are stable.
    [[nodiscard]] std::string encode(std::string_view algorithm, std::string_view password) const;

private:
    const AlgorithmRegistry& m_registry;
    const ParameterStore& m_store;
};

} // namespace credhash::core

#endif // INCLUDE_CREDHASH_CORE_ENCODER_HPP
