#include "credhash/crypto/Bcrypt.hpp"

#include "credhash/security/ScopeWipe.hpp"
#include "credhash/security/SecureEquals.hpp"
#include "credhash/security/SecureRandom.hpp"
#include "credhash/security/SecureString.hpp"
#include <array>
#include <crypt.h>
#include <memory>
#include <span>
#include <stdexcept>

namespace credhash::crypto
{
namespace
{

constexpr std::string_view g_kBcryptPrefix{ "$2b$" };
constexpr std::string_view g_kBcryptAlphabet{ "./ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789" };
constexpr std::size_t g_kCostOffset{ 4U };
constexpr std::size_t g_kPayloadOffset{ 7U };
constexpr int g_kDecimalBase{ 10 };

// crypt_rn wants NUL-terminated inputs.
[[nodiscard]] credhash::security::SecureString terminated(std::string_view s)
{
    auto out{ credhash::security::secureStringFrom(s) };
    out.push_back('\0');
    return out;
}

// crypt_data carries intermediate state; it is wiped before release.
struct CryptDataDeleter final
{
    void operator()(crypt_data* data) const noexcept
    {
        credhash::security::secureWipe(std::span<std::byte>{ reinterpret_cast<std::byte*>(data), sizeof(crypt_data) });
        delete data;
    }
};
using CryptDataPtr = std::unique_ptr<crypt_data, CryptDataDeleter>;

// crypt_data is about 32 KiB; it lives on the heap.
[[nodiscard]] CryptDataPtr makeCryptData()
{
    return CryptDataPtr{ new crypt_data{} };
}

} // namespace

std::optional<int> bcryptCost(std::string_view modularHash) noexcept
{
    if (modularHash.size() != g_kBcryptModularHashChars)
    {
        return std::nullopt;
    }
    if (modularHash[0] != '$' || modularHash[1] != '2' || modularHash[3] != '$' || modularHash[6] != '$')
    {
        return std::nullopt;
    }
    const char variant{ modularHash[2] };
    if (variant != 'a' && variant != 'b' && variant != 'y')
    {
        return std::nullopt;
    }

    const char tens{ modularHash[g_kCostOffset] };
    const char ones{ modularHash[g_kCostOffset + 1U] };
    if (tens < '0' || tens > '9' || ones < '0' || ones > '9')
    {
        return std::nullopt;
    }
    const int cost{ ((tens - '0') * g_kDecimalBase) + (ones - '0') };
    if (cost < g_kBcryptMinCost || cost > g_kBcryptMaxCost)
    {
        return std::nullopt;
    }

    return cost;
}

bool bcryptAcceptsPassword(std::string_view password) noexcept
{
    return password.size() <= g_kBcryptMaxPasswordBytes && password.find('\0') == std::string_view::npos;
}

std::string bcryptHash(std::string_view password, int cost)
{
    if (cost < g_kBcryptMinCost || cost > g_kBcryptMaxCost)
    {
        throw std::invalid_argument("bcryptHash: cost out of range");
    }
    if (!bcryptAcceptsPassword(password))
    {
        throw std::invalid_argument("bcryptHash: password longer than 72 bytes or contains NUL");
    }

    std::array<std::uint8_t, g_kBcryptSaltBytes> salt{};
    auto wipeSalt{ credhash::security::scopeWipe(std::span<std::uint8_t>{ salt }) };
    if (!credhash::security::secureRandomFill(std::span<std::uint8_t>{ salt }))
    {
        throw std::runtime_error("bcryptHash: CSPRNG failure");
    }

    std::array<char, CRYPT_GENSALT_OUTPUT_SIZE> setting{};
    if (::crypt_gensalt_rn(g_kBcryptPrefix.data(), static_cast<unsigned long>(cost),
                           reinterpret_cast<const char*>(salt.data()), static_cast<int>(salt.size()), setting.data(),
                           static_cast<int>(setting.size())) == nullptr)
    {
        throw std::runtime_error("bcryptHash: crypt_gensalt_rn failed");
    }

    auto phrase{ terminated(password) };
    auto wipePhrase{ credhash::security::scopeWipe(phrase) };

    const CryptDataPtr data{ makeCryptData() };
    const char* result{ ::crypt_rn(phrase.data(), setting.data(), data.get(), static_cast<int>(sizeof(crypt_data))) };
    if (result == nullptr || result[0] == '*')
    {
        throw std::runtime_error("bcryptHash: crypt_rn failed");
    }

    std::string out{ result };
    if (!bcryptCost(out).has_value())
    {
        throw std::runtime_error("bcryptHash: unexpected crypt_rn output");
    }
    return out;
}

BcryptCheck bcryptCheck(std::string_view password, std::string_view modularHash)
{
    if (!bcryptCost(modularHash).has_value())
    {
        return BcryptCheck::InvalidHash;
    }
    // A corrupted salt or digest cannot equal anything crypt_rn produces.
    if (modularHash.substr(g_kPayloadOffset).find_first_not_of(g_kBcryptAlphabet) != std::string_view::npos)
    {
        return BcryptCheck::Mismatch;
    }
    if (!bcryptAcceptsPassword(password))
    {
        return BcryptCheck::Mismatch;
    }

    auto phrase{ terminated(password) };
    auto wipePhrase{ credhash::security::scopeWipe(phrase) };
    const std::string setting{ modularHash };

    const CryptDataPtr data{ makeCryptData() };
    const char* result{ ::crypt_rn(phrase.data(), setting.c_str(), data.get(), static_cast<int>(sizeof(crypt_data))) };
    // The shape already passed; a refusal here comes from the salt or digest content.
    if (result == nullptr || result[0] == '*')
    {
        return BcryptCheck::Mismatch;
    }

    return credhash::security::secureEquals(std::string_view{ result }, modularHash) ? BcryptCheck::Match
                                                                                     : BcryptCheck::Mismatch;
}

} // namespace credhash::crypto
