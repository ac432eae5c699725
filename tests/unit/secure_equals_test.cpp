#include "credhash/security/SecureBuffer.hpp"
#include "credhash/security/SecureEquals.hpp"
#include <cstddef>
#include <gtest/gtest.h>
#include <vector>

namespace
{

using namespace credhash::security;

TEST(SecureEqualsTest, MismatchedSizesReturnFalse)
{
    std::vector<std::byte> a(10);
    std::vector<std::byte> b(5);
    EXPECT_FALSE(secureEquals(std::span<const std::byte>{ a }, std::span<const std::byte>{ b }));
}

TEST(SecureEqualsTest, PrefixIsNotEqual)
{
    EXPECT_FALSE(secureEquals(std::string_view{ "abc" }, std::string_view{ "abcd" }));
    EXPECT_FALSE(secureEquals(std::string_view{ "" }, std::string_view{ "a" }));
}

TEST(SecureEqualsTest, SameSizeDifferentContentReturnsFalse)
{
    std::vector<std::byte> a(10, std::byte{ 1 });
    std::vector<std::byte> b(10, std::byte{ 1 });
    b.back() = std::byte{ 2 };
    EXPECT_FALSE(secureEquals(std::span<const std::byte>{ a }, std::span<const std::byte>{ b }));
}

TEST(SecureEqualsTest, SameSizeSameContentReturnsTrue)
{
    std::vector<std::byte> a(10, std::byte{ 1 });
    std::vector<std::byte> b(10, std::byte{ 1 });
    EXPECT_TRUE(secureEquals(std::span<const std::byte>{ a }, std::span<const std::byte>{ b }));
}

TEST(SecureEqualsTest, EmptyInputsAreEqual)
{
    EXPECT_TRUE(secureEquals(std::string_view{}, std::string_view{}));
}

TEST(SecureEqualsTest, OverloadsWork)
{
    SecureBuffer sb1(5);
    SecureBuffer sb2(5);
    EXPECT_TRUE(secureEquals(sb1, sb2));
    sb2[0] = 1U;
    EXPECT_FALSE(secureEquals(sb1, sb2));

    EXPECT_TRUE(secureEquals(std::string_view{ "abc" }, std::string_view{ "abc" }));
    EXPECT_FALSE(secureEquals(std::string_view{ "abc" }, std::string_view{ "abd" }));
}

} // namespace
