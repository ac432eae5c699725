#ifndef INCLUDE_CREDHASH_CORE_HASHFORMAT_HPP
#define INCLUDE_CREDHASH_CORE_HASHFORMAT_HPP

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace credhash::core
{

constexpr char g_kFieldDelimiter{ '$' };

// Field counts include the empty field before the leading '$'.
constexpr std::size_t g_kArgon2idFieldCount{ 5U };
constexpr std::size_t g_kBcryptFieldCount{ 4U };

// Views into the parsed string; they are valid only while that string is.

// $argon2id$v=<d>,m=<d>,t=<d>,p=<d>$<salt>$<hash>
struct Argon2idFormat final
{
    std::uint64_t version;
    std::uint64_t memoryKiB;
    std::uint64_t iterations;
    std::uint64_t parallelism;
    std::string_view salt;
    std::string_view hash;
};

// $bcrypt$c=<d>$<base64 of the bcrypt modular crypt string>
struct BcryptFormat final
{
    std::uint64_t cost;
    std::string_view payload;
};

enum class MalformedReason : std::uint8_t
{
    MissingPrefix,
    FieldCount,
    Parameters,
    UnknownAlgorithm,
};

struct Malformed final
{
    MalformedReason reason;
    std::string field;
};

using HashFormat = std::variant<Argon2idFormat, BcryptFormat, Malformed>;

[[nodiscard]] std::vector<std::string_view> splitFields(std::string_view encoded);

// The tag after the leading '$', or std::nullopt when the string does not have the
// "$<tag>$..." shape at all.
[[nodiscard]] std::optional<std::string_view> extractAlgorithmTag(std::string_view encoded);

[[nodiscard]] HashFormat parseArgon2idFormat(std::span<const std::string_view> fields);
[[nodiscard]] HashFormat parseBcryptFormat(std::span<const std::string_view> fields);

// Dispatches on the tag. Only checks shape and the parameter grammar; values are
// range-checked by the decoder.
[[nodiscard]] HashFormat parseHashFormat(std::string_view encoded);

} // namespace credhash::core

#endif // INCLUDE_CREDHASH_CORE_HASHFORMAT_HPP
