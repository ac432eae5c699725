#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <string_view>

#include "credhash/crypto/Bcrypt.hpp"

namespace
{

// $2a$ hash of "password123" at cost 4, produced by another bcrypt implementation.
constexpr std::string_view g_kForeignHash{ "$2a$04$5VhHRqnWMKDJczSsr/qLduyRpljk1WO0N3H5sfuWEwKfuNLgR8rM6" };
constexpr int g_kFastCost{ 4 };

} // namespace

TEST(Bcrypt, HashHasModularCryptShape)
{
    const std::string hash{ credhash::crypto::bcryptHash("password123", g_kFastCost) };

    ASSERT_EQ(hash.size(), credhash::crypto::g_kBcryptModularHashChars);
    EXPECT_EQ(hash.substr(0, 7), "$2b$04$");
    EXPECT_EQ(credhash::crypto::bcryptCost(hash), g_kFastCost);
}

TEST(Bcrypt, FreshSaltPerHash)
{
    EXPECT_NE(credhash::crypto::bcryptHash("password123", g_kFastCost),
              credhash::crypto::bcryptHash("password123", g_kFastCost));
}

TEST(Bcrypt, CheckMatchesOnlyTheRightPassword)
{
    const std::string hash{ credhash::crypto::bcryptHash("s3cret", g_kFastCost) };

    EXPECT_EQ(credhash::crypto::bcryptCheck("s3cret", hash), credhash::crypto::BcryptCheck::Match);
    EXPECT_EQ(credhash::crypto::bcryptCheck("s3cret!", hash), credhash::crypto::BcryptCheck::Mismatch);
    EXPECT_EQ(credhash::crypto::bcryptCheck("", hash), credhash::crypto::BcryptCheck::Mismatch);
}

TEST(Bcrypt, ChecksForeign2aHash)
{
    EXPECT_EQ(credhash::crypto::bcryptCheck("password123", g_kForeignHash), credhash::crypto::BcryptCheck::Match);
    EXPECT_EQ(credhash::crypto::bcryptCheck("password124", g_kForeignHash), credhash::crypto::BcryptCheck::Mismatch);
}

TEST(Bcrypt, RejectsCostOutsideRange)
{
    EXPECT_THROW((void)credhash::crypto::bcryptHash("pw", 3), std::invalid_argument);
    EXPECT_THROW((void)credhash::crypto::bcryptHash("pw", 32), std::invalid_argument);
}

TEST(Bcrypt, RejectsPasswordsItCannotRepresent)
{
    const std::string tooLong(credhash::crypto::g_kBcryptMaxPasswordBytes + 1U, 'a');
    const std::string withNul{ "abc\0def", 7U };

    EXPECT_THROW((void)credhash::crypto::bcryptHash(tooLong, g_kFastCost), std::invalid_argument);
    EXPECT_THROW((void)credhash::crypto::bcryptHash(withNul, g_kFastCost), std::invalid_argument);
}

TEST(Bcrypt, UnrepresentablePasswordNeverMatches)
{
    // bcrypt only reads 72 bytes; a longer password must not match the hash of its prefix.
    const std::string prefix(credhash::crypto::g_kBcryptMaxPasswordBytes, 'a');
    const std::string hash{ credhash::crypto::bcryptHash(prefix, g_kFastCost) };

    EXPECT_EQ(credhash::crypto::bcryptCheck(prefix, hash), credhash::crypto::BcryptCheck::Match);
    EXPECT_EQ(credhash::crypto::bcryptCheck(prefix + "b", hash), credhash::crypto::BcryptCheck::Mismatch);
}

TEST(Bcrypt, CostParsesStructure)
{
    EXPECT_EQ(credhash::crypto::bcryptCost(g_kForeignHash), 4);
    EXPECT_FALSE(credhash::crypto::bcryptCost("").has_value());
    EXPECT_FALSE(credhash::crypto::bcryptCost("$2x$04$5VhHRqnWMKDJczSsr/qLduyRpljk1WO0N3H5sfuWEwKfuNLgR8rM6").has_value());
    EXPECT_FALSE(credhash::crypto::bcryptCost("$2a$03$5VhHRqnWMKDJczSsr/qLduyRpljk1WO0N3H5sfuWEwKfuNLgR8rM6").has_value());
    EXPECT_FALSE(credhash::crypto::bcryptCost("$2a$04$5VhHRqnWMKDJczSsr/qLduyRpljk1WO0N3H5sfuWEwKfuNLgR8rM").has_value());
    EXPECT_FALSE(credhash::crypto::bcryptCost("$2a$4$5VhHRqnWMKDJczSsr/qLduyRpljk1WO0N3H5sfuWEwKfuNLgR8rM6A").has_value());
}

TEST(Bcrypt, CorruptedSaltOrDigestIsAMismatch)
{
    // '+' and '$' are outside the bcrypt alphabet; the shape is still intact.
    constexpr std::string_view kBadSalt{ "$2a$04$5VhHRqnWMKDJczSsr+qLduyRpljk1WO0N3H5sfuWEwKfuNLgR8rM6" };
    constexpr std::string_view kBadDigest{ "$2a$04$5VhHRqnWMKDJczSsr/qLduyRpljk1WO0N3H5sfuWEwKfuNLgR8rM$" };

    EXPECT_EQ(credhash::crypto::bcryptCost(kBadSalt), 4);
    EXPECT_EQ(credhash::crypto::bcryptCheck("password123", kBadSalt), credhash::crypto::BcryptCheck::Mismatch);
    EXPECT_EQ(credhash::crypto::bcryptCheck("password123", kBadDigest), credhash::crypto::BcryptCheck::Mismatch);

    std::string flipped{ g_kForeignHash };
    flipped[20] = (flipped[20] == 'A') ? 'B' : 'A';
    EXPECT_EQ(credhash::crypto::bcryptCheck("password123", flipped), credhash::crypto::BcryptCheck::Mismatch);
}

TEST(Bcrypt, AcceptsPasswordLimits)
{
    EXPECT_TRUE(credhash::crypto::bcryptAcceptsPassword(""));
    EXPECT_TRUE(credhash::crypto::bcryptAcceptsPassword(std::string(credhash::crypto::g_kBcryptMaxPasswordBytes, 'a')));
    EXPECT_FALSE(
        credhash::crypto::bcryptAcceptsPassword(std::string(credhash::crypto::g_kBcryptMaxPasswordBytes + 1U, 'a')));
    EXPECT_FALSE(credhash::crypto::bcryptAcceptsPassword(std::string_view{ "a\0b", 3U }));
}

TEST(Bcrypt, CheckReportsInvalidHash)
{
    EXPECT_EQ(credhash::crypto::bcryptCheck("pw", "not a bcrypt hash"), credhash::crypto::BcryptCheck::InvalidHash);
}
