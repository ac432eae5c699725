#include "credhash/crypto/KeyDerivation.hpp"
#include "credhash/crypto/providers/OpenSslProviderFactory.hpp"
#include "credhash/security/SecureBuffer.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <openssl/core_names.h>
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/params.h>
#include <span>
#include <stdexcept>

namespace credhash::crypto::providers
{
namespace
{

// Spelled out because the OSSL_KDF_PARAM_ARGON2_* macros only exist in 3.2+ headers.
constexpr const char* g_kKdfParamArgon2Memcost{ "memcost" };
constexpr const char* g_kKdfParamArgon2Lanes{ "lanes" };
constexpr const char* g_kKdfParamThreads{ "threads" };
constexpr const char* g_kKdfParamArgon2Version{ "version" };

using EvpKdfPtr = std::unique_ptr<EVP_KDF, decltype(&EVP_KDF_free)>;
using EvpKdfCtxPtr = std::unique_ptr<EVP_KDF_CTX, decltype(&EVP_KDF_CTX_free)>;

EvpKdfPtr fetchArgon2idKdf()
{
    return EvpKdfPtr{ EVP_KDF_fetch(nullptr, "ARGON2ID", nullptr), &EVP_KDF_free };
}

class OpenSslKdfProvider final : public credhash::crypto::IKdfProvider
{
public:
    OpenSslKdfProvider() : m_argon2idKdf{ fetchArgon2idKdf() }
    {
    }

    [[nodiscard]] std::string_view name() const noexcept override
    {
        return "openssl";
    }

    [[nodiscard]] credhash::security::SecureBuffer deriveArgon2id(std::span<const std::byte> password,
                                                                  std::span<const std::uint8_t> salt,
                                                                  credhash::crypto::Argon2idParams params,
                                                                  std::size_t outBytes) const override
    {
        credhash::crypto::requireArgon2idInputsSafe(password, salt, params, outBytes);

        if (!m_argon2idKdf)
        {
            throw std::runtime_error("deriveArgon2id: OpenSSL Argon2id KDF not available");
        }

        EvpKdfCtxPtr ctx{ EVP_KDF_CTX_new(m_argon2idKdf.get()), &EVP_KDF_CTX_free };
        if (!ctx)
        {
            throw std::runtime_error("deriveArgon2id: EVP_KDF_CTX_new failed");
        }

        std::uint32_t iter{ params.iterations };
        std::uint32_t memcostKiB{ params.memoryKiB };
        std::uint32_t lanes{ params.parallelism };
        // Lanes are part of the output; threads are not. One thread avoids depending on
        // OSSL_set_max_threads having been configured by the host process.
        std::uint32_t threads{ 1U };
        std::uint32_t version{ credhash::crypto::g_kArgon2VersionV13 };

        // OSSL_PARAM takes non-const pointers even for inputs; hand it private copies.
        const auto* passwordBytes{ reinterpret_cast<const std::uint8_t*>(password.data()) };
        credhash::security::SecureBuffer passwordCopy(passwordBytes, passwordBytes + password.size());
        credhash::security::SecureBuffer saltCopy(salt.begin(), salt.end());

        OSSL_PARAM osslParams[]{
            OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_PASSWORD, passwordCopy.data(), passwordCopy.size()),
            OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_SALT, saltCopy.data(), saltCopy.size()),
            OSSL_PARAM_construct_uint32(OSSL_KDF_PARAM_ITER, &iter),
            OSSL_PARAM_construct_uint32(g_kKdfParamArgon2Memcost, &memcostKiB),
            OSSL_PARAM_construct_uint32(g_kKdfParamArgon2Lanes, &lanes),
            OSSL_PARAM_construct_uint32(g_kKdfParamThreads, &threads),
            OSSL_PARAM_construct_uint32(g_kKdfParamArgon2Version, &version),
            OSSL_PARAM_construct_end(),
        };

        credhash::security::SecureBuffer out(outBytes);
        if (EVP_KDF_derive(ctx.get(), out.data(), out.size(), osslParams) <= 0)
        {
            throw std::runtime_error("deriveArgon2id: EVP_KDF_derive failed");
        }
        return out;
    }

private:
    EvpKdfPtr m_argon2idKdf;
};

} // namespace

std::unique_ptr<credhash::crypto::IKdfProvider> makeOpenSslKdfProvider()
{
    return std::make_unique<OpenSslKdfProvider>();
}

} // namespace credhash::crypto::providers
