#include "credhash/crypto/KeyDerivation.hpp"

#include <cstdint>
#include <limits>
#include <stdexcept>

namespace credhash::crypto
{

void requireArgon2idInputsSafe(std::span<const std::byte> password, std::span<const std::uint8_t> salt,
                               Argon2idParams params, std::size_t outBytes)
{
    if (password.size() > std::numeric_limits<std::uint32_t>::max())
    {
        throw std::invalid_argument("deriveArgon2id: password too large");
    }
    if (salt.size() < g_kArgon2MinSaltBytes || salt.size() > g_kArgon2MaxSaltBytes)
    {
        throw std::invalid_argument("deriveArgon2id: invalid salt size");
    }
    if (outBytes < g_kArgon2MinOutBytes || outBytes > g_kArgon2MaxOutBytes)
    {
        throw std::invalid_argument("deriveArgon2id: invalid output size");
    }

    if (params.iterations == 0U || params.parallelism == 0U)
    {
        throw std::invalid_argument("deriveArgon2id: invalid parameters");
    }
    if (params.iterations > g_kArgon2MaxIterations || params.parallelism > g_kArgon2MaxParallelism ||
        params.memoryKiB > g_kArgon2MaxMemoryKiB)
    {
        throw std::invalid_argument("deriveArgon2id: unsafe parameters");
    }
    if (params.memoryKiB < params.parallelism * g_kArgon2MinBlocksPerLane)
    {
        throw std::invalid_argument("deriveArgon2id: memory too small for parallelism");
    }
}

} // namespace credhash::crypto
