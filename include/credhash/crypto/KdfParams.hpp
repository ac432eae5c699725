#ifndef INCLUDE_CREDHASH_CRYPTO_KDFPARAMS_HPP
#define INCLUDE_CREDHASH_CRYPTO_KDFPARAMS_HPP

#include <cstddef>
#include <cstdint>

namespace credhash::crypto
{

// Argon2 version v1.3 (0x13, printed as v=19). Monocypher is hardcoded to this.
constexpr std::uint32_t g_kArgon2VersionV13{ 0x13 };

constexpr std::size_t g_kArgon2MinSaltBytes{ 8U };
constexpr std::size_t g_kArgon2MaxSaltBytes{ 1024U };
constexpr std::size_t g_kArgon2MinOutBytes{ 4U };
constexpr std::size_t g_kArgon2MaxOutBytes{ 1024U };

// Ceilings this build is willing to evaluate. A stored hash above any of them is
// refused rather than allowed to pin a worker on a gigantic allocation.
constexpr std::uint32_t g_kArgon2MaxMemoryKiB{ 1024U * 1024U };
constexpr std::uint32_t g_kArgon2MaxIterations{ 64U };
constexpr std::uint32_t g_kArgon2MaxParallelism{ 255U };

// Argon2 needs at least 8 KiB blocks per lane.
constexpr std::uint32_t g_kArgon2MinBlocksPerLane{ 8U };

struct Argon2idParams final
{
    std::uint32_t iterations;
    std::uint32_t memoryKiB;
    std::uint32_t parallelism;
};

} // namespace credhash::crypto

#endif // INCLUDE_CREDHASH_CRYPTO_KDFPARAMS_HPP
