#include "credhash/core/Verifier.hpp"

#include "credhash/core/AlgorithmRegistry.hpp"
#include "credhash/core/Decoder.hpp"
#include "credhash/core/Errors.hpp"
#include "credhash/core/HashFormat.hpp"

namespace credhash::core
{

bool Verifier::verify(std::string_view password, std::string_view encoded) const
{
    const auto tag{ extractAlgorithmTag(encoded) };
    if (!tag.has_value())
    {
        throw FormatError{ "encoded hash has no algorithm tag", "algorithm" };
    }

    const PasswordAlgorithm& algorithm{ m_registry.lookup(*tag) };
    const DecodedHash decoded{ algorithm.decode(encoded) };
    return algorithm.verify(password, decoded);
}

} // namespace credhash::core
