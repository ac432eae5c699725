#include "credhash/crypto/Base64.hpp"

#include <array>
#include <cstddef>

namespace credhash::crypto
{
namespace
{

constexpr std::string_view g_kAlphabet{ "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/" };
constexpr std::int8_t g_kInvalid{ -1 };
constexpr std::uint32_t g_kSextetMask{ 0x3FU };
constexpr std::uint32_t g_kByteMask{ 0xFFU };

constexpr std::array<std::int8_t, 256> makeDecodeTable() noexcept
{
    std::array<std::int8_t, 256> table{};
    for (auto& entry : table)
    {
        entry = g_kInvalid;
    }
    for (std::size_t i{}; i < g_kAlphabet.size(); ++i)
    {
        table[static_cast<unsigned char>(g_kAlphabet[i])] = static_cast<std::int8_t>(i);
    }
    return table;
}

constexpr std::array<std::int8_t, 256> g_kDecodeTable{ makeDecodeTable() };

} // namespace

std::string base64EncodeUnpadded(std::span<const std::uint8_t> bytes)
{
    std::string out{};
    out.reserve(((bytes.size() + 2U) / 3U) * 4U);

    std::size_t i{};
    for (; i + 3U <= bytes.size(); i += 3U)
    {
        const std::uint32_t group{ (static_cast<std::uint32_t>(bytes[i]) << 16U) |
                                   (static_cast<std::uint32_t>(bytes[i + 1U]) << 8U) |
                                   static_cast<std::uint32_t>(bytes[i + 2U]) };
        out.push_back(g_kAlphabet[(group >> 18U) & g_kSextetMask]);
        out.push_back(g_kAlphabet[(group >> 12U) & g_kSextetMask]);
        out.push_back(g_kAlphabet[(group >> 6U) & g_kSextetMask]);
        out.push_back(g_kAlphabet[group & g_kSextetMask]);
    }

    const std::size_t rest{ bytes.size() - i };
    if (rest == 1U)
    {
        const std::uint32_t group{ static_cast<std::uint32_t>(bytes[i]) << 16U };
        out.push_back(g_kAlphabet[(group >> 18U) & g_kSextetMask]);
        out.push_back(g_kAlphabet[(group >> 12U) & g_kSextetMask]);
    }
    else if (rest == 2U)
    {
        const std::uint32_t group{ (static_cast<std::uint32_t>(bytes[i]) << 16U) |
                                   (static_cast<std::uint32_t>(bytes[i + 1U]) << 8U) };
        out.push_back(g_kAlphabet[(group >> 18U) & g_kSextetMask]);
        out.push_back(g_kAlphabet[(group >> 12U) & g_kSextetMask]);
        out.push_back(g_kAlphabet[(group >> 6U) & g_kSextetMask]);
    }

    return out;
}

std::optional<std::vector<std::uint8_t>> base64DecodeUnpadded(std::string_view text)
{
    if ((text.size() % 4U) == 1U)
    {
        return std::nullopt;
    }

    std::vector<std::uint8_t> out{};
    out.reserve((text.size() * 3U) / 4U);

    std::uint32_t acc{};
    std::uint32_t bits{};
    for (const char c : text)
    {
        const std::int8_t value{ g_kDecodeTable[static_cast<unsigned char>(c)] };
        if (value == g_kInvalid)
        {
            return std::nullopt;
        }

        acc = (acc << 6U) | static_cast<std::uint32_t>(value);
        bits += 6U;
        if (bits >= 8U)
        {
            bits -= 8U;
            out.push_back(static_cast<std::uint8_t>((acc >> bits) & g_kByteMask));
        }
    }

    // Leftover bits must be zero, otherwise two different strings would decode to the same bytes.
    if (bits > 0U && (acc & ((1U << bits) - 1U)) != 0U)
    {
        return std::nullopt;
    }

    return out;
}

} // namespace credhash::crypto
