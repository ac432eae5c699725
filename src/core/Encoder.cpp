#include "credhash/core/Encoder.hpp"

#include "credhash/core/AlgorithmRegistry.hpp"
#include "credhash/core/HashFormat.hpp"
#include "credhash/core/ParameterStore.hpp"
#include "credhash/crypto/Base64.hpp"
#include "credhash/crypto/KdfParams.hpp"
#include <string>

namespace credhash::core
{

std::string formatArgon2id(const Argon2idParameters& params, std::span<const std::uint8_t> salt,
                           std::span<const std::uint8_t> hash)
{
    std::string out{};
    out += g_kFieldDelimiter;
    out += g_kArgon2idName;
    out += "$v=";
    out += std::to_string(credhash::crypto::g_kArgon2VersionV13);
    out += ",m=";
    out += std::to_string(params.memoryCostKiB);
    out += ",t=";
    out += std::to_string(params.iterations);
    out += ",p=";
    out += std::to_string(static_cast<unsigned>(params.parallelism));
    out += g_kFieldDelimiter;
    out += credhash::crypto::base64EncodeUnpadded(salt);
    out += g_kFieldDelimiter;
    out += credhash::crypto::base64EncodeUnpadded(hash);
    return out;
}

std::string formatBcrypt(const BcryptParameters& params, std::string_view modularHash)
{
    const std::span<const std::uint8_t> bytes{ reinterpret_cast<const std::uint8_t*>(modularHash.data()),
                                               modularHash.size() };

    std::string out{};
    out += g_kFieldDelimiter;
    out += g_kBcryptName;
    out += "$c=";
    out += std::to_string(params.cost);
    out += g_kFieldDelimiter;
    out += credhash::crypto::base64EncodeUnpadded(bytes);
    return out;
}

std::string Encoder::encode(std::string_view algorithm, std::string_view password) const
{
    const PasswordAlgorithm& entry{ m_registry.lookup(algorithm) };
    const AlgorithmParameters params{ entry.resolveParameters(m_store) };
    return entry.encode(password, params);
}

} // namespace credhash::core
