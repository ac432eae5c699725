#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "CredentialShell.hpp"
#include "credhash/core/AlgorithmRegistry.hpp"
#include "credhash/core/ConfigSource.hpp"
#include "credhash/core/ParameterStore.hpp"
#include "credhash/core/PasswordHasher.hpp"
#include "credhash/crypto/providers/NativeProviderFactory.hpp"
#include "test_utils/TestUtils.hpp"

#include <memory>
#include <sstream>
#include <string>
#include <vector>

using ::testing::HasSubstr;
using ::testing::Not;

class CredentialShellTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        m_kdf = credhash::crypto::providers::makeNativeKdfProvider();
        m_registry = std::make_unique<credhash::core::AlgorithmRegistry>(credhash::core::makeDefaultRegistry(*m_kdf));
        m_config = std::make_unique<credhash::core::MapConfigSource>(credhash::test_utils::fastConfig());
        m_store = std::make_unique<credhash::core::ParameterStore>(*m_config);
        m_hasher = std::make_unique<credhash::core::PasswordHasher>(*m_registry, *m_store);
    }

    [[nodiscard]] credhash::ui::cli::CredentialShell makeShell(const std::string& password)
    {
        return credhash::ui::cli::CredentialShell{ *m_hasher, m_inContent, m_outContent,
                                                   [password](const std::string&)
                                                   { return credhash::security::secureStringFrom(password); } };
    }

    // Runs one command and returns the line the command printed last.
    [[nodiscard]] std::string lastLine() const
    {
        std::string text{ m_outContent.str() };
        while (!text.empty() && text.back() == '\n')
        {
            text.pop_back();
        }
        const auto pos{ text.rfind('\n') };
        return (pos == std::string::npos) ? text : text.substr(pos + 1U);
    }

    std::unique_ptr<credhash::crypto::IKdfProvider> m_kdf;          // NOLINT
    std::unique_ptr<credhash::core::AlgorithmRegistry> m_registry; // NOLINT
    std::unique_ptr<credhash::core::MapConfigSource> m_config;     // NOLINT
    std::unique_ptr<credhash::core::ParameterStore> m_store;       // NOLINT
    std::unique_ptr<credhash::core::PasswordHasher> m_hasher;      // NOLINT

    std::stringstream m_inContent;  // NOLINT
    std::stringstream m_outContent; // NOLINT
};

TEST_F(CredentialShellTest, HashPrintsVerifiableEncoding)
{
    auto shell = makeShell("pass123");
    EXPECT_EQ(shell.execute({ "hash", "argon2id" }), credhash::ui::cli::g_kExitOk);

    const std::string encoded{ lastLine() };
    EXPECT_THAT(encoded, ::testing::StartsWith("$argon2id$v=19,m=64,t=1,p=1$"));
    EXPECT_TRUE(m_hasher->verify("pass123", encoded));
    EXPECT_THAT(m_outContent.str(), Not(HasSubstr("pass123")));
}

TEST_F(CredentialShellTest, VerifyReportsMatchAndMismatch)
{
    const std::string encoded{ m_hasher->hash("bcrypt", "right") };

    auto good = makeShell("right");
    EXPECT_EQ(good.execute({ "verify", encoded }), credhash::ui::cli::g_kExitOk);
    EXPECT_EQ(lastLine(), "match");

    auto bad = makeShell("wrong");
    EXPECT_EQ(bad.execute({ "verify", encoded }), credhash::ui::cli::g_kExitNegative);
    EXPECT_EQ(lastLine(), "no match");
}

TEST_F(CredentialShellTest, HashFailsOnPasswordMismatch)
{
    int callCount = 0;
    credhash::ui::cli::CredentialShell shell{ *m_hasher, m_inContent, m_outContent,
                                              [&](const std::string&)
                                              {
                                                  callCount++;
                                                  return (callCount == 1) ? credhash::security::secureStringFrom("passA")
                                                                          : credhash::security::secureStringFrom("passB");
                                              } };

    EXPECT_EQ(shell.execute({ "hash", "argon2id" }), credhash::ui::cli::g_kExitError);
    EXPECT_THAT(m_outContent.str(), HasSubstr("Error: Passwords do not match."));
    EXPECT_THAT(m_outContent.str(), Not(HasSubstr("$argon2id$")));
}

TEST_F(CredentialShellTest, DecodeShowsParameters)
{
    auto shell = makeShell("");
    EXPECT_EQ(shell.execute({ "decode", "$argon2id$v=19,m=65536,t=6,p=2$gQc4ZccIqosKqCMKYUgP8A$"
                                        "x/xg/7uiPsBrRd11wC0mtiM2fjeqHzqTcjs2fLMsiGw" }),
              credhash::ui::cli::g_kExitOk);

    const std::string output{ m_outContent.str() };
    EXPECT_THAT(output, HasSubstr("algorithm: argon2id"));
    EXPECT_THAT(output, HasSubstr("memory (KiB): 65536"));
    EXPECT_THAT(output, HasSubstr("iterations: 6"));
    EXPECT_THAT(output, HasSubstr("parallelism: 2"));
    EXPECT_THAT(output, HasSubstr("salt length: 16"));
    EXPECT_THAT(output, HasSubstr("key length: 32"));
}

TEST_F(CredentialShellTest, ErrorsAreReportedWithField)
{
    auto shell = makeShell("pw");

    EXPECT_EQ(shell.execute({ "verify", "not-a-valid-hash" }), credhash::ui::cli::g_kExitError);
    EXPECT_THAT(lastLine(), HasSubstr("Error: "));
    EXPECT_THAT(lastLine(), HasSubstr("[algorithm]"));

    EXPECT_EQ(shell.execute({ "hash", "scrypt" }), credhash::ui::cli::g_kExitError);
    EXPECT_THAT(lastLine(), HasSubstr("[scrypt]"));
}

TEST_F(CredentialShellTest, NeedsRehashFollowsConfiguration)
{
    const std::string encoded{ m_hasher->hash("bcrypt", "pw") };
    auto shell = makeShell("");

    EXPECT_EQ(shell.execute({ "needs-rehash", encoded, "bcrypt" }), credhash::ui::cli::g_kExitNegative);
    EXPECT_EQ(lastLine(), "no");

    m_config->set(std::string{ credhash::core::g_kBcryptCostKey }, "6");
    EXPECT_EQ(shell.execute({ "needs-rehash", encoded, "bcrypt" }), credhash::ui::cli::g_kExitOk);
    EXPECT_EQ(lastLine(), "yes");
}

TEST_F(CredentialShellTest, MissingArgumentIsSyntaxError)
{
    auto shell = makeShell("");
    EXPECT_EQ(shell.execute({ "verify" }), credhash::ui::cli::g_kExitError);
    EXPECT_THAT(m_outContent.str(), HasSubstr("Syntax Error"));
}

TEST_F(CredentialShellTest, InteractiveSessionFlow)
{
    const std::string encoded{ m_hasher->hash("argon2id", "pass123") };

    m_inContent << "algorithms\n";
    m_inContent << "verify " << encoded << "\n";
    m_inContent << "verify 'unterminated\n";
    m_inContent << "help\n";
    m_inContent << "exit\n";
    m_inContent << "algorithms\n";

    auto shell = makeShell("pass123");
    EXPECT_EQ(shell.run(), credhash::ui::cli::g_kExitOk);

    const std::string output{ m_outContent.str() };
    EXPECT_THAT(output, HasSubstr(" - argon2id\n - bcrypt\n"));
    EXPECT_THAT(output, HasSubstr("match\n"));
    EXPECT_THAT(output, HasSubstr("Syntax Error: unterminated quote"));
    EXPECT_THAT(output, HasSubstr("needs-rehash"));

    // Nothing after exit is executed.
    const auto first{ output.find(" - argon2id") };
    EXPECT_EQ(output.find(" - argon2id", first + 1U), std::string::npos);
}

TEST_F(CredentialShellTest, StopsAtEndOfInput)
{
    m_inContent << "algorithms\n";
    auto shell = makeShell("");
    EXPECT_EQ(shell.run(), credhash::ui::cli::g_kExitOk);
    EXPECT_THAT(m_outContent.str(), HasSubstr(" - bcrypt"));
}

TEST_F(CredentialShellTest, HashReportsPasswordBcryptCannotTake)
{
    const std::string tooLong(73U, 'q');
    auto shell = makeShell(tooLong);
    EXPECT_EQ(shell.execute({ "hash", "bcrypt" }), credhash::ui::cli::g_kExitError);
    EXPECT_THAT(lastLine(), ::testing::StartsWith("Error: "));
    EXPECT_THAT(lastLine(), HasSubstr("[password]"));
    EXPECT_THAT(m_outContent.str(), Not(HasSubstr(tooLong)));
}
