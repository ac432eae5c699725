#include "credhash/core/Decoder.hpp"

#include "credhash/core/Errors.hpp"
#include "credhash/core/HashFormat.hpp"
#include "credhash/crypto/Base64.hpp"
#include "credhash/crypto/Bcrypt.hpp"
#include "credhash/crypto/KdfParams.hpp"
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace credhash::core
{
namespace
{

[[nodiscard]] std::vector<std::uint8_t> decodeBase64Field(std::string_view text, const char* field)
{
    auto bytes{ credhash::crypto::base64DecodeUnpadded(text) };
    if (!bytes.has_value())
    {
        throw FormatError{ std::string{ "invalid base64 in " } + field, field };
    }
    return std::move(*bytes);
}

[[nodiscard]] DecodedHash decodeArgon2id(const Argon2idFormat& format)
{
    namespace kdf = credhash::crypto;

    // Version gate first: a newer format must never be evaluated with v1.3 semantics.
    if (format.version != kdf::g_kArgon2VersionV13)
    {
        throw IncompatibilityError{ "unsupported Argon2 version " + std::to_string(format.version), "v" };
    }

    if (format.parallelism == 0U)
    {
        throw FormatError{ "parallelism must be positive", "p" };
    }
    if (format.iterations == 0U)
    {
        throw FormatError{ "iterations must be positive", "t" };
    }
    if (format.parallelism > kdf::g_kArgon2MaxParallelism)
    {
        throw FormatError{ "parallelism exceeds 255", "p" };
    }
    if (format.memoryKiB < format.parallelism * kdf::g_kArgon2MinBlocksPerLane)
    {
        throw FormatError{ "memory below 8 KiB per lane", "m" };
    }
    if (format.memoryKiB > kdf::g_kArgon2MaxMemoryKiB)
    {
        throw IncompatibilityError{ "memory cost exceeds supported maximum", "m" };
    }
    if (format.iterations > kdf::g_kArgon2MaxIterations)
    {
        throw IncompatibilityError{ "iteration count exceeds supported maximum", "t" };
    }

    auto salt{ decodeBase64Field(format.salt, "salt") };
    auto hash{ decodeBase64Field(format.hash, "hash") };

    if (salt.size() < kdf::g_kArgon2MinSaltBytes || salt.size() > kdf::g_kArgon2MaxSaltBytes)
    {
        throw FormatError{ "salt length out of range", "salt" };
    }
    if (hash.size() < kdf::g_kArgon2MinOutBytes || hash.size() > kdf::g_kArgon2MaxOutBytes)
    {
        throw FormatError{ "hash length out of range", "hash" };
    }

    const Argon2idParameters params{
        .memoryCostKiB = static_cast<std::uint32_t>(format.memoryKiB),
        .iterations = static_cast<std::uint32_t>(format.iterations),
        .parallelism = static_cast<std::uint8_t>(format.parallelism),
        .saltLength = static_cast<std::uint32_t>(salt.size()),
        .keyLength = static_cast<std::uint32_t>(hash.size()),
    };

    return DecodedHash{ .algorithm = std::string{ g_kArgon2idName },
                        .parameters = params,
                        .salt = std::move(salt),
                        .hash = std::move(hash) };
}

[[nodiscard]] DecodedHash decodeBcrypt(const BcryptFormat& format)
{
    if (format.cost < static_cast<std::uint64_t>(credhash::crypto::g_kBcryptMinCost) ||
        format.cost > static_cast<std::uint64_t>(credhash::crypto::g_kBcryptMaxCost))
    {
        throw FormatError{ "bcrypt cost out of range", "c" };
    }

    auto hash{ decodeBase64Field(format.payload, "hash") };

    const std::string_view modular{ reinterpret_cast<const char*>(hash.data()), hash.size() };
    const auto embeddedCost{ credhash::crypto::bcryptCost(modular) };
    if (!embeddedCost.has_value())
    {
        throw FormatError{ "payload is not a bcrypt hash", "hash" };
    }
    if (static_cast<std::uint64_t>(*embeddedCost) != format.cost)
    {
        throw FormatError{ "declared cost does not match the embedded cost", "c" };
    }

    return DecodedHash{ .algorithm = std::string{ g_kBcryptName },
                        .parameters = BcryptParameters{ .cost = *embeddedCost },
                        .salt = {},
                        .hash = std::move(hash) };
}

} // namespace

DecodedHash decode(std::string_view encoded)
{
    const HashFormat format{ parseHashFormat(encoded) };

    return std::visit(
        [](const auto& f) -> DecodedHash {
            using T = std::decay_t<decltype(f)>;
            if constexpr (std::is_same_v<T, Argon2idFormat>)
            {
                return decodeArgon2id(f);
            }
            else if constexpr (std::is_same_v<T, BcryptFormat>)
            {
                return decodeBcrypt(f);
            }
            else
            {
                if (f.reason == MalformedReason::UnknownAlgorithm)
                {
                    throw UnsupportedAlgorithmError{ "unsupported algorithm " + f.field, f.field };
                }
                throw FormatError{ "malformed encoded hash (" + f.field + ")", f.field };
            }
        },
        format);
}

} // namespace credhash::core
