#include "credhash/core/AlgorithmRegistry.hpp"

#include "credhash/core/Argon2idAlgorithm.hpp"
#include "credhash/core/BcryptAlgorithm.hpp"
#include "credhash/core/Errors.hpp"
#include <stdexcept>
#include <utility>

namespace credhash::core
{

void AlgorithmRegistry::add(std::unique_ptr<PasswordAlgorithm> algorithm)
{
    if (!algorithm)
    {
        throw std::invalid_argument("AlgorithmRegistry::add: null algorithm");
    }

    std::string key{ algorithm->name() };
    if (key.empty() || m_entries.contains(key))
    {
        throw std::invalid_argument("AlgorithmRegistry::add: duplicate or empty name");
    }
    m_entries.emplace(std::move(key), std::move(algorithm));
}

const PasswordAlgorithm& AlgorithmRegistry::lookup(std::string_view name) const
{
    if (const auto it{ m_entries.find(name) }; it != m_entries.end())
    {
        return *it->second;
    }
    throw UnsupportedAlgorithmError{ "unsupported algorithm " + std::string{ name }, std::string{ name } };
}

bool AlgorithmRegistry::contains(std::string_view name) const
{
    return m_entries.find(name) != m_entries.end();
}

std::vector<std::string> AlgorithmRegistry::names() const
{
    std::vector<std::string> out{};
    out.reserve(m_entries.size());
    for (const auto& entry : m_entries)
    {
        out.push_back(entry.first);
    }
    return out;
}

AlgorithmRegistry makeDefaultRegistry(const credhash::crypto::IKdfProvider& kdf)
{
    AlgorithmRegistry registry{};
    registry.add(std::make_unique<Argon2idAlgorithm>(kdf));
    registry.add(std::make_unique<BcryptAlgorithm>());
    return registry;
}

} // namespace credhash::core
