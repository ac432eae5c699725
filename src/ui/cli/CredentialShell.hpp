#ifndef CREDHASH_UI_CLI_CREDENTIALSHELL_HPP
#define CREDHASH_UI_CLI_CREDENTIALSHELL_HPP

#include "credhash/core/PasswordHasher.hpp"
#include "credhash/security/SecureString.hpp"

#include <functional>
#include <iosfwd>
#include <string>
#include <vector>

namespace credhash::ui::cli
{

// In tests: returns a pre-determined string.
using PasswordReader = std::function<credhash::security::SecureString(const std::string&)>;

constexpr int g_kExitOk{ 0 };
// verify: password does not match. needs-rehash: stored hash is current.
constexpr int g_kExitNegative{ 1 };
constexpr int g_kExitError{ 2 };

class CredentialShell final
{
public:
    CredentialShell(const credhash::core::PasswordHasher& hasher, std::istream& in, std::ostream& out,
                    PasswordReader pwdReader);

    // Read-eval loop until exit/quit or end of input.
    int run();

    // One command given on the process command line; returns the exit status.
    int execute(std::vector<std::string> args);

private:
    const credhash::core::PasswordHasher& m_hasher;
    std::istream& m_in;
    std::ostream& m_out;
    PasswordReader m_pwdReader;

    bool m_running{ true };
    int m_status{ g_kExitOk };

    void processLine(const std::string& line);

    void doHash(const std::string& algorithm);
    void doVerify(const std::string& encoded);
    void doDecode(const std::string& encoded);
    void doNeedsRehash(const std::string& encoded, const std::string& algorithm);
    void doAlgorithms();
};

} // namespace credhash::ui::cli

#endif // CREDHASH_UI_CLI_CREDENTIALSHELL_HPP
