#ifndef INCLUDE_CREDHASH_CORE_VERIFIER_HPP
#define INCLUDE_CREDHASH_CORE_VERIFIER_HPP

#include <string_view>

namespace credhash::core
{

class AlgorithmRegistry;

class Verifier final
{
public:
    explicit Verifier(const AlgorithmRegistry& registry) noexcept : m_registry{ registry }
    {
    }

    // true on match, false on mismatch. FormatError for input without the "$<tag>$" shape,
    // UnsupportedAlgorithmError for an unregistered tag; decode errors propagate unchanged.
    [[nodiscard]] bool verify(std::string_view password, std::string_view encoded) const;

private:
    const AlgorithmRegistry& m_registry;
};

} // namespace credhash::core

#endif // INCLUDE_CREDHASH_CORE_VERIFIER_HPP
