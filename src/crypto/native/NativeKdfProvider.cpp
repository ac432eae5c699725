#include "credhash/crypto/KeyDerivation.hpp"
#include "credhash/crypto/providers/NativeProviderFactory.hpp"

namespace credhash::crypto::providers
{
namespace
{

class NativeKdfProvider final : public credhash::crypto::IKdfProvider
{
public:
    [[nodiscard]] std::string_view name() const noexcept override
    {
        return "monocypher";
    }

    [[nodiscard]] credhash::security::SecureBuffer deriveArgon2id(std::span<const std::byte> password,
                                                                  std::span<const std::uint8_t> salt,
                                                                  credhash::crypto::Argon2idParams params,
                                                                  std::size_t outBytes) const override
    {
        return credhash::crypto::deriveArgon2id(password, salt, params, outBytes);
    }
};

} // namespace

std::unique_ptr<credhash::crypto::IKdfProvider> makeNativeKdfProvider()
{
    return std::make_unique<NativeKdfProvider>();
}

} // namespace credhash::crypto::providers
