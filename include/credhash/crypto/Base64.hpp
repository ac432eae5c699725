#ifndef INCLUDE_CREDHASH_CRYPTO_BASE64_HPP
#define INCLUDE_CREDHASH_CRYPTO_BASE64_HPP

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace credhash::crypto
{

// Standard alphabet (RFC 4648 section 4), no '=' padding, as used by PHC strings.
[[nodiscard]] std::string base64EncodeUnpadded(std::span<const std::uint8_t> bytes);

// Strict inverse of base64EncodeUnpadded: rejects padding, whitespace, the URL alphabet,
// an impossible length (4n+1) and non-zero trailing bits. Returns std::nullopt on any of them.
[[nodiscard]] std::optional<std::vector<std::uint8_t>> base64DecodeUnpadded(std::string_view text);

} // namespace credhash::crypto

#endif // INCLUDE_CREDHASH_CRYPTO_BASE64_HPP
