#ifndef INCLUDE_CREDHASH_CORE_ALGORITHMREGISTRY_HPP
#define INCLUDE_CREDHASH_CORE_ALGORITHMREGISTRY_HPP

#include "credhash/core/PasswordAlgorithm.hpp"
#include "credhash/crypto/IKdfProvider.hpp"
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace credhash::core
{

// Name -> algorithm. Filled once at startup, then handed to Encoder/Verifier by
// const reference; lookups never mutate, so sharing across threads needs no lock.
// Adding an algorithm is one more add() call at the composition root.
class AlgorithmRegistry final
{
public:
    AlgorithmRegistry() = default;
    AlgorithmRegistry(const AlgorithmRegistry&) = delete;
    AlgorithmRegistry& operator=(const AlgorithmRegistry&) = delete;
    AlgorithmRegistry(AlgorithmRegistry&&) noexcept = default;
    AlgorithmRegistry& operator=(AlgorithmRegistry&&) noexcept = default;
    ~AlgorithmRegistry() = default;

    // Throws std::invalid_argument for a null entry or a name already taken.
    void add(std::unique_ptr<PasswordAlgorithm> algorithm);

    // Throws UnsupportedAlgorithmError.
    [[nodiscard]] const PasswordAlgorithm& lookup(std::string_view name) const;

    [[nodiscard]] bool contains(std::string_view name) const;
    [[nodiscard]] std::vector<std::string> names() const;

private:
    std::map<std::string, std::unique_ptr<PasswordAlgorithm>, std::less<>> m_entries;
};

// "argon2id" backed by kdf, and "bcrypt". kdf must outlive the registry.
[[nodiscard]] AlgorithmRegistry makeDefaultRegistry(const credhash::crypto::IKdfProvider& kdf);

} // namespace credhash::core

#endif // INCLUDE_CREDHASH_CORE_ALGORITHMREGISTRY_HPP
