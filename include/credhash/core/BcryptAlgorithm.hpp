#ifndef INCLUDE_CREDHASH_CORE_BCRYPTALGORITHM_HPP
#define INCLUDE_CREDHASH_CORE_BCRYPTALGORITHM_HPP

#include "credhash/core/PasswordAlgorithm.hpp"

namespace credhash::core
{

// bcrypt manages its own salt; the comparison is delegated to the primitive.
class BcryptAlgorithm final : public PasswordAlgorithm
{
public:
    [[nodiscard]] std::string_view name() const noexcept override;
    [[nodiscard]] AlgorithmParameters resolveParameters(const ParameterStore& store) const override;
    [[nodiscard]] std::string encode(std::string_view password, const AlgorithmParameters& params) const override;
    [[nodiscard]] bool verify(std::string_view password, const DecodedHash& decoded) const override;
};

} // namespace credhash::core

#endif // INCLUDE_CREDHASH_CORE_BCRYPTALGORITHM_HPP
