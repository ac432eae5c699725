#ifndef INCLUDE_CREDHASH_CORE_PASSWORDALGORITHM_HPP
#define INCLUDE_CREDHASH_CORE_PASSWORDALGORITHM_HPP

#include "credhash/core/AlgorithmParameters.hpp"
#include "credhash/core/Decoder.hpp"
#include <string>
#include <string_view>

namespace credhash::core
{

class ParameterStore;

// One registry entry: the encode and verify halves of a hashing scheme.
// Implementations hold no per-call state and must be callable concurrently.
class PasswordAlgorithm
{
public:
    PasswordAlgorithm() = default;
    PasswordAlgorithm(const PasswordAlgorithm&) = delete;
    PasswordAlgorithm& operator=(const PasswordAlgorithm&) = delete;
    PasswordAlgorithm(PasswordAlgorithm&&) = delete;
    PasswordAlgorithm& operator=(PasswordAlgorithm&&) = delete;
    virtual ~PasswordAlgorithm() = default;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    // Reads this algorithm's tunables from the store. Called on every encode, never cached.
    // ConfigurationError when a value is missing or out of range.
    [[nodiscard]] virtual AlgorithmParameters resolveParameters(const ParameterStore& store) const = 0;

    // Returns the canonical encoded string. Parameters of another algorithm are a
    // contract violation (std::invalid_argument).
    [[nodiscard]] virtual std::string encode(std::string_view password, const AlgorithmParameters& params) const = 0;

    // Algorithms with their own grammar override this; the built-in ones share decode().
    [[nodiscard]] virtual DecodedHash decode(std::string_view encoded) const
    {
        return credhash::core::decode(encoded);
    }

    // false on mismatch; throws only for input that cannot be evaluated.
    [[nodiscard]] virtual bool verify(std::string_view password, const DecodedHash& decoded) const = 0;
};

} // namespace credhash::core

#endif // INCLUDE_CREDHASH_CORE_PASSWORDALGORITHM_HPP
