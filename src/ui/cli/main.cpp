#include "ConsoleUtils.hpp"
#include "CredentialShell.hpp"

#include "credhash/core/AlgorithmRegistry.hpp"
#include "credhash/core/ConfigSource.hpp"
#include "credhash/core/ParameterStore.hpp"
#include "credhash/core/PasswordHasher.hpp"
#include "credhash/crypto/providers/NativeProviderFactory.hpp"
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#if defined(CREDHASH_ENABLE_OPENSSL)
#include "credhash/crypto/providers/OpenSslProviderFactory.hpp"
#endif

namespace
{

constexpr const char* g_kBackendKey{ "CREDHASH_KDF_BACKEND" };

[[nodiscard]] std::unique_ptr<credhash::crypto::IKdfProvider> makeKdfProvider(const credhash::core::ConfigSource& env)
{
#if defined(CREDHASH_ENABLE_OPENSSL)
    if (env.value(g_kBackendKey) == std::string{ "openssl" })
    {
        return credhash::crypto::providers::makeOpenSslKdfProvider();
    }
#else
    (void)env;
#endif
    return credhash::crypto::providers::makeNativeKdfProvider();
}

} // namespace

int main(int argc, char** argv)
{
    try
    {
        credhash::ui::cli::lockProcessMemory();

        const credhash::core::EnvConfigSource env{};
        const credhash::core::ParameterStore store{ env };
        const auto kdf{ makeKdfProvider(env) };
        const auto registry{ credhash::core::makeDefaultRegistry(*kdf) };
        const credhash::core::PasswordHasher hasher{ registry, store };

        credhash::ui::cli::CredentialShell shell{
            hasher, std::cin, std::cout,
            [](const std::string& prompt)
            { return credhash::ui::cli::readPassword(prompt, std::cin, std::cerr); } };

        if (argc <= 1)
        {
            return shell.run();
        }
        return shell.execute(std::vector<std::string>{ argv + 1, argv + argc });
    }
    catch (const std::exception& e)
    {
        std::cerr << "fatal: " << e.what() << '\n';
        return credhash::ui::cli::g_kExitError;
    }
}
