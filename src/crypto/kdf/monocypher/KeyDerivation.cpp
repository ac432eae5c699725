#include "credhash/crypto/KeyDerivation.hpp"

#include "credhash/security/ZeroAllocator.hpp"
#include <monocypher.h>

#include <cstddef>
#include <cstdint>
#include <limits>
#include <new>
#include <vector>

namespace credhash::crypto
{

[[nodiscard]] credhash::security::SecureBuffer deriveArgon2id(std::span<const std::byte> password,
                                                              std::span<const std::uint8_t> salt,
                                                              Argon2idParams params, std::size_t outBytes)
{
    requireArgon2idInputsSafe(password, salt, params, outBytes);

    constexpr std::size_t kU64WordsPerBlock{ 128U }; // 1 KiB block / sizeof(uint64_t)
    if (params.memoryKiB > (std::numeric_limits<std::size_t>::max() / kU64WordsPerBlock))
    {
        throw std::bad_alloc{};
    }

    // Scratch area lives only for this call and is wiped on release.
    const std::size_t workWords{ static_cast<std::size_t>(params.memoryKiB) * kU64WordsPerBlock };
    std::vector<std::uint64_t, credhash::security::ZeroAllocator<std::uint64_t>> workArea(workWords);

    credhash::security::SecureBuffer out(outBytes);

    const crypto_argon2_config cfg{ .algorithm = CRYPTO_ARGON2_ID,
                                    .nb_blocks = params.memoryKiB,
                                    .nb_passes = params.iterations,
                                    .nb_lanes = params.parallelism };

    const crypto_argon2_inputs inputs{ .pass = reinterpret_cast<const std::uint8_t*>(password.data()),
                                       .salt = salt.data(),
                                       .pass_size = static_cast<std::uint32_t>(password.size()),
                                       .salt_size = static_cast<std::uint32_t>(salt.size()) };

    crypto_argon2(out.data(), static_cast<std::uint32_t>(out.size()), workArea.data(), cfg, inputs,
                  crypto_argon2_no_extras);

    return out;
}

} // namespace credhash::crypto
