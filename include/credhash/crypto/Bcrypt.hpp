#ifndef INCLUDE_CREDHASH_CRYPTO_BCRYPT_HPP
#define INCLUDE_CREDHASH_CRYPTO_BCRYPT_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace credhash::crypto
{

constexpr int g_kBcryptMinCost{ 4 };
constexpr int g_kBcryptMaxCost{ 31 };
constexpr std::size_t g_kBcryptMaxPasswordBytes{ 72U };
constexpr std::size_t g_kBcryptSaltBytes{ 16U };

// "$2b$" + two cost digits + "$" + 22 salt chars + 31 hash chars.
constexpr std::size_t g_kBcryptModularHashChars{ 60U };

enum class BcryptCheck : std::uint8_t
{
    Match,
    Mismatch,
    InvalidHash,
};

// Hashes with a fresh 16-byte salt from the OS CSPRNG and returns the "$2b$NN$..." string.
// Throws std::invalid_argument for a cost outside [4, 31] or a password bcrypt cannot represent
// (longer than 72 bytes or containing NUL), std::runtime_error if libxcrypt or the entropy source fails.
[[nodiscard]] std::string bcryptHash(std::string_view password, int cost);

// Recomputes with the salt and cost embedded in modularHash and compares in constant time.
// InvalidHash only for a bad shape; any salt or digest content crypt_rn cannot reproduce is
// a Mismatch. Passwords bcryptHash would refuse never match.
[[nodiscard]] BcryptCheck bcryptCheck(std::string_view password, std::string_view modularHash);

// Shape check of a "$2a$", "$2b$" or "$2y$" string (length, prefix, cost digits); returns its cost.
// The salt and digest characters are not inspected.
[[nodiscard]] std::optional<int> bcryptCost(std::string_view modularHash) noexcept;

// false for passwords longer than 72 bytes or containing NUL.
[[nodiscard]] bool bcryptAcceptsPassword(std::string_view password) noexcept;

} // namespace credhash::crypto

#endif // INCLUDE_CREDHASH_CRYPTO_BCRYPT_HPP
