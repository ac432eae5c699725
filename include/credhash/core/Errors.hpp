#ifndef INCLUDE_CREDHASH_CORE_ERRORS_HPP
#define INCLUDE_CREDHASH_CORE_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <utility>

namespace credhash::core
{

// Base of every error the password hashing core raises. field() names the configuration key,
// grammar field or algorithm at fault. Messages never carry passwords or hash bytes.
class PasswordHashError : public std::runtime_error
{
public:
    PasswordHashError(const std::string& what, std::string field)
        : std::runtime_error{ what }, m_field{ std::move(field) }
    {
    }

    [[nodiscard]] const std::string& field() const noexcept
    {
        return m_field;
    }

private:
    std::string m_field;
};

// Required parameter absent, non-numeric or outside the algorithm's legal range.
class ConfigurationError final : public PasswordHashError
{
public:
    using PasswordHashError::PasswordHashError;
};

class UnsupportedAlgorithmError final : public PasswordHashError
{
public:
    using PasswordHashError::PasswordHashError;
};

// Structurally invalid encoded hash. Never used for "wrong password".
class FormatError final : public PasswordHashError
{
public:
    using PasswordHashError::PasswordHashError;
};

// Well-formed hash this build cannot evaluate (other algorithm version, parameters past our ceilings).
class IncompatibilityError final : public PasswordHashError
{
public:
    using PasswordHashError::PasswordHashError;
};

// Password the algorithm cannot represent (bcrypt: over 72 bytes or an embedded NUL).
// field() is "password"; the message never quotes it.
class UnsupportedPasswordError final : public PasswordHashError
{
public:
    using PasswordHashError::PasswordHashError;
};

// Entropy source or derivation primitive failed. Not retried.
class CryptoFailure final : public PasswordHashError
{
public:
    using PasswordHashError::PasswordHashError;
};

} // namespace credhash::core

#endif // INCLUDE_CREDHASH_CORE_ERRORS_HPP
