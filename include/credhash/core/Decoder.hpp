#ifndef INCLUDE_CREDHASH_CORE_DECODER_HPP
#define INCLUDE_CREDHASH_CORE_DECODER_HPP

#include "credhash/core/AlgorithmParameters.hpp"
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace credhash::core
{

struct DecodedHash final
{
    std::string algorithm;
    AlgorithmParameters parameters;
    // Empty for algorithms that embed their salt in the hash (bcrypt).
    std::vector<std::uint8_t> salt;
    // argon2id: raw derived key. bcrypt: the modular crypt string's bytes.
    std::vector<std::uint8_t> hash;

    bool operator==(const DecodedHash&) const = default;
};

// Pure parse of an encoded hash.
// FormatError: wrong shape, bad parameter grammar or values, invalid base64, impossible lengths.
// IncompatibilityError: Argon2 version other than v=19, or parameters past this build's ceilings.
// UnsupportedAlgorithmError: well-shaped string with an unknown tag.
// Salt and key lengths come from the decoded bytes, never from claims inside the string.
[[nodiscard]] DecodedHash decode(std::string_view encoded);

} // namespace credhash::core

#endif // INCLUDE_CREDHASH_CORE_DECODER_HPP
