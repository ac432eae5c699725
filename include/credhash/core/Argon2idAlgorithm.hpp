#ifndef INCLUDE_CREDHASH_CORE_ARGON2IDALGORITHM_HPP
#define INCLUDE_CREDHASH_CORE_ARGON2IDALGORITHM_HPP

#include "credhash/core/PasswordAlgorithm.hpp"
#include "credhash/crypto/IKdfProvider.hpp"

namespace credhash::core
{

class Argon2idAlgorithm final : public PasswordAlgorithm
{
public:
    explicit Argon2idAlgorithm(const credhash::crypto::IKdfProvider& kdf) noexcept : m_kdf{ kdf }
    {
    }

    [[nodiscard]] std::string_view name() const noexcept override;
    [[nodiscard]] AlgorithmParameters resolveParameters(const ParameterStore& store) const override;

    // CryptoFailure when the salt cannot be drawn or the KDF backend fails.
    [[nodiscard]] std::string encode(std::string_view password, const AlgorithmParameters& params) const override;

    // Re-derives with the decoded salt, parameters and key length, then compares in constant time.
    [[nodiscard]] bool verify(std::string_view password, const DecodedHash& decoded) const override;

private:
    const credhash::crypto::IKdfProvider& m_kdf;
};

} // namespace credhash::core

#endif // INCLUDE_CREDHASH_CORE_ARGON2IDALGORITHM_HPP
