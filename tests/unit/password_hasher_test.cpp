#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "credhash/core/AlgorithmRegistry.hpp"
#include "credhash/core/ConfigSource.hpp"
#include "credhash/core/Errors.hpp"
#include "credhash/core/ParameterStore.hpp"
#include "credhash/core/PasswordHasher.hpp"
#include "credhash/crypto/providers/NativeProviderFactory.hpp"
#include "test_utils/TestUtils.hpp"

namespace
{

class PasswordHasherTest : public ::testing::Test
{
protected:
    std::unique_ptr<credhash::crypto::IKdfProvider> m_kdf{ credhash::crypto::providers::makeNativeKdfProvider() }; // NOLINT
    credhash::core::AlgorithmRegistry m_registry{ credhash::core::makeDefaultRegistry(*m_kdf) };                 // NOLINT
    credhash::core::MapConfigSource m_config{ credhash::test_utils::fastConfig() };                              // NOLINT
    credhash::core::ParameterStore m_store{ m_config };                                                          // NOLINT
    credhash::core::PasswordHasher m_hasher{ m_registry, m_store };                                              // NOLINT

    void set(std::string_view key, std::string value)
    {
        m_config.set(std::string{ key }, std::move(value));
    }
};

TEST_F(PasswordHasherTest, HashThenVerify)
{
    const std::string stored{ m_hasher.hash("argon2id", "letmein") };
    EXPECT_TRUE(m_hasher.verify("letmein", stored));
    EXPECT_FALSE(m_hasher.verify("letmeout", stored));
}

TEST_F(PasswordHasherTest, ListsAlgorithms)
{
    const auto names{ m_hasher.algorithms() };
    ASSERT_EQ(names.size(), 2U);
    EXPECT_EQ(names[0], "argon2id");
    EXPECT_EQ(names[1], "bcrypt");
}

TEST_F(PasswordHasherTest, DecodeUsesTaggedAlgorithm)
{
    const auto decoded{ m_hasher.decode(m_hasher.hash("bcrypt", "pw")) };
    EXPECT_EQ(decoded.algorithm, "bcrypt");
    EXPECT_EQ(std::get<credhash::core::BcryptParameters>(decoded.parameters).cost, 4);
    EXPECT_THROW((void)m_hasher.decode("plain text"), credhash::core::FormatError);
}

TEST_F(PasswordHasherTest, FreshHashNeedsNoRehash)
{
    EXPECT_FALSE(m_hasher.needsRehash(m_hasher.hash("argon2id", "pw"), "argon2id"));
    EXPECT_FALSE(m_hasher.needsRehash(m_hasher.hash("bcrypt", "pw"), "bcrypt"));
}

TEST_F(PasswordHasherTest, RehashWhenCostRaised)
{
    const std::string argon{ m_hasher.hash("argon2id", "pw") };
    const std::string bcrypt{ m_hasher.hash("bcrypt", "pw") };

    set(credhash::core::g_kArgon2idIterationsKey, "2");
    set(credhash::core::g_kBcryptCostKey, "5");

    EXPECT_TRUE(m_hasher.needsRehash(argon, "argon2id"));
    EXPECT_TRUE(m_hasher.needsRehash(bcrypt, "bcrypt"));
}

TEST_F(PasswordHasherTest, RehashWhenLengthsChange)
{
    const std::string stored{ m_hasher.hash("argon2id", "pw") };

    set(credhash::core::g_kArgon2idKeyLengthKey, "64");
    EXPECT_TRUE(m_hasher.needsRehash(stored, "argon2id"));

    set(credhash::core::g_kArgon2idKeyLengthKey, "32");
    set(credhash::core::g_kArgon2idSaltLengthKey, "32");
    EXPECT_TRUE(m_hasher.needsRehash(stored, "argon2id"));
}

TEST_F(PasswordHasherTest, RehashWhenMigratingAlgorithm)
{
    const std::string legacy{ m_hasher.hash("bcrypt", "pw") };
    EXPECT_TRUE(m_hasher.needsRehash(legacy, "argon2id"));
    EXPECT_FALSE(m_hasher.needsRehash(legacy, "bcrypt"));
}

TEST_F(PasswordHasherTest, NeedsRehashPropagatesErrors)
{
    const std::string stored{ m_hasher.hash("argon2id", "pw") };

    EXPECT_THROW((void)m_hasher.needsRehash(stored, "scrypt"), credhash::core::UnsupportedAlgorithmError);
    EXPECT_THROW((void)m_hasher.needsRehash("garbage", "argon2id"), credhash::core::FormatError);

    m_config.erase(credhash::core::g_kArgon2idMemoryKey);
    EXPECT_THROW((void)m_hasher.needsRehash(stored, "argon2id"), credhash::core::ConfigurationError);
}

} // namespace
