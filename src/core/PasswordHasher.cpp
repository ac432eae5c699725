#include "credhash/core/PasswordHasher.hpp"

#include "credhash/core/Errors.hpp"
#include "credhash/core/HashFormat.hpp"

namespace credhash::core
{

DecodedHash PasswordHasher::decode(std::string_view encoded) const
{
    const auto tag{ extractAlgorithmTag(encoded) };
    if (!tag.has_value())
    {
        throw FormatError{ "encoded hash has no algorithm tag", "algorithm" };
    }
    return m_registry.lookup(*tag).decode(encoded);
}

bool PasswordHasher::needsRehash(std::string_view encoded, std::string_view algorithm) const
{
    const PasswordAlgorithm& target{ m_registry.lookup(algorithm) };
    const AlgorithmParameters current{ target.resolveParameters(m_store) };

    const DecodedHash decoded{ decode(encoded) };
    if (decoded.algorithm != target.name())
    {
        return true;
    }
    return decoded.parameters != current;
}

} // namespace credhash::core
