#ifndef INCLUDE_CREDHASH_CORE_PASSWORDHASHER_HPP
#define INCLUDE_CREDHASH_CORE_PASSWORDHASHER_HPP

#include "credhash/core/AlgorithmRegistry.hpp"
#include "credhash/core/Decoder.hpp"
#include "credhash/core/Encoder.hpp"
#include "credhash/core/ParameterStore.hpp"
#include "credhash/core/Verifier.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace credhash::core
{

// Entry point for callers that store credentials: one object for hashing on
// registration, checking on login and deciding when to upgrade a stored hash.
class PasswordHasher final
{
public:
    PasswordHasher(const AlgorithmRegistry& registry, const ParameterStore& store) noexcept
        : m_registry{ registry }, m_store{ store }, m_encoder{ registry, store }, m_verifier{ registry }
    {
    }

    [[nodiscard]] std::string hash(std::string_view algorithm, std::string_view password) const
    {
        return m_encoder.encode(algorithm, password);
    }

    [[nodiscard]] bool verify(std::string_view password, std::string_view encoded) const
    {
        return m_verifier.verify(password, encoded);
    }

    // Decodes with the grammar of the algorithm the string is tagged with.
    [[nodiscard]] DecodedHash decode(std::string_view encoded) const;

    [[nodiscard]] std::vector<std::string> algorithms() const
    {
        return m_registry.names();
    }

    // true when encoded was produced by another algorithm or with parameters (including salt
    // and key length) that differ from what is configured for algorithm right now. Meant to be
    // asked after a successful verify, when the plaintext is at hand for re-hashing.
    [[nodiscard]] bool needsRehash(std::string_view encoded, std::string_view algorithm) const;

private:
    const AlgorithmRegistry& m_registry;
    const ParameterStore& m_store;
    Encoder m_encoder;
    Verifier m_verifier;
};

} // namespace credhash::core

#endif // INCLUDE_CREDHASH_CORE_PASSWORDHASHER_HPP
