#include "credhash/core/HashFormat.hpp"

#include "Decimal.hpp"
#include "credhash/core/AlgorithmParameters.hpp"
#include <array>

namespace credhash::core
{
namespace
{

constexpr char g_kParamDelimiter{ ',' };
constexpr char g_kKeyValueDelimiter{ '=' };
constexpr std::size_t g_kMinFieldCount{ 3U };

constexpr std::array<std::string_view, 4> g_kArgon2idKeys{ "v", "m", "t", "p" };
constexpr std::string_view g_kBcryptCostKey{ "c" };

[[nodiscard]] std::vector<std::string_view> split(std::string_view text, char delimiter)
{
    std::vector<std::string_view> parts{};
    std::size_t start{};
    while (true)
    {
        const std::size_t pos{ text.find(delimiter, start) };
        if (pos == std::string_view::npos)
        {
            parts.push_back(text.substr(start));
            break;
        }
        parts.push_back(text.substr(start, pos - start));
        start = pos + 1U;
    }
    return parts;
}

// "<key>=<canonical decimal>"
[[nodiscard]] std::optional<std::uint64_t> parseKeyValue(std::string_view pair, std::string_view expectedKey) noexcept
{
    const std::size_t eq{ pair.find(g_kKeyValueDelimiter) };
    if (eq == std::string_view::npos || pair.substr(0, eq) != expectedKey)
    {
        return std::nullopt;
    }
    return detail::parseCanonicalDecimal(pair.substr(eq + 1U));
}

[[nodiscard]] Malformed malformed(MalformedReason reason, std::string_view field)
{
    return Malformed{ .reason = reason, .field = std::string{ field } };
}

} // namespace

std::vector<std::string_view> splitFields(std::string_view encoded)
{
    return split(encoded, g_kFieldDelimiter);
}

std::optional<std::string_view> extractAlgorithmTag(std::string_view encoded)
{
    const auto fields{ splitFields(encoded) };
    if (fields.size() < g_kMinFieldCount || !fields[0].empty() || fields[1].empty())
    {
        return std::nullopt;
    }
    return fields[1];
}

HashFormat parseArgon2idFormat(std::span<const std::string_view> fields)
{
    if (fields.size() != g_kArgon2idFieldCount)
    {
        return malformed(MalformedReason::FieldCount, "fields");
    }

    const auto params{ split(fields[2], g_kParamDelimiter) };
    if (params.size() != g_kArgon2idKeys.size())
    {
        return malformed(MalformedReason::Parameters, "params");
    }

    std::array<std::uint64_t, g_kArgon2idKeys.size()> values{};
    for (std::size_t i{}; i < g_kArgon2idKeys.size(); ++i)
    {
        const auto value{ parseKeyValue(params[i], g_kArgon2idKeys[i]) };
        if (!value.has_value())
        {
            return malformed(MalformedReason::Parameters, g_kArgon2idKeys[i]);
        }
        values[i] = *value;
    }

    return Argon2idFormat{
        .version = values[0],
        .memoryKiB = values[1],
        .iterations = values[2],
        .parallelism = values[3],
        .salt = fields[3],
        .hash = fields[4],
    };
}

HashFormat parseBcryptFormat(std::span<const std::string_view> fields)
{
    if (fields.size() != g_kBcryptFieldCount)
    {
        return malformed(MalformedReason::FieldCount, "fields");
    }

    const auto cost{ parseKeyValue(fields[2], g_kBcryptCostKey) };
    if (!cost.has_value())
    {
        return malformed(MalformedReason::Parameters, g_kBcryptCostKey);
    }

    return BcryptFormat{ .cost = *cost, .payload = fields[3] };
}

HashFormat parseHashFormat(std::string_view encoded)
{
    const auto fields{ splitFields(encoded) };
    if (fields.size() < g_kMinFieldCount || !fields[0].empty() || fields[1].empty())
    {
        return malformed(MalformedReason::MissingPrefix, "prefix");
    }

    const std::string_view tag{ fields[1] };
    if (tag == g_kArgon2idName)
    {
        return parseArgon2idFormat(fields);
    }
    if (tag == g_kBcryptName)
    {
        return parseBcryptFormat(fields);
    }
    return malformed(MalformedReason::UnknownAlgorithm, tag);
}

} // namespace credhash::core
