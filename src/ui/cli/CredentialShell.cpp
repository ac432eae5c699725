#include "CredentialShell.hpp"
#include "Tokenizer.hpp"

#include "credhash/core/Errors.hpp"
#include "credhash/security/ScopeWipe.hpp"

#include <CLI/CLI.hpp>
#include <iostream>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace credhash::ui::cli
{
namespace
{

void printParameters(std::ostream& out, const credhash::core::DecodedHash& decoded)
{
    out << "algorithm: " << decoded.algorithm << "\n";
    std::visit(
        [&out](const auto& params)
        {
            using T = std::decay_t<decltype(params)>;
            if constexpr (std::is_same_v<T, credhash::core::Argon2idParameters>)
            {
                out << "memory (KiB): " << params.memoryCostKiB << "\n";
                out << "iterations: " << params.iterations << "\n";
                out << "parallelism: " << static_cast<unsigned>(params.parallelism) << "\n";
                out << "salt length: " << params.saltLength << "\n";
                out << "key length: " << params.keyLength << "\n";
            }
            else if constexpr (std::is_same_v<T, credhash::core::BcryptParameters>)
            {
                out << "cost: " << params.cost << "\n";
            }
            else
            {
                for (const auto& [key, value] : params.values)
                {
                    out << key << ": " << value << "\n";
                }
            }
        },
        decoded.parameters);
}

} // namespace

CredentialShell::CredentialShell(const credhash::core::PasswordHasher& hasher, std::istream& in, std::ostream& out,
                                 PasswordReader pwdReader)
    : m_hasher(hasher), m_in(in), m_out(out), m_pwdReader(std::move(pwdReader))
{
}

int CredentialShell::run()
{
    m_out << "credhash shell\n";
    m_out << "Type 'help' for available commands.\n";

    std::string line;
    while (m_running && m_in.good())
    {
        m_out << "credhash> ";

        if (!std::getline(m_in, line))
        {
            break;
        }
        if (line.empty())
        {
            continue;
        }

        processLine(line);
    }
    return g_kExitOk;
}

void CredentialShell::processLine(const std::string& line)
{
    auto tokens{ tokenizeLine(line) };
    if (!tokens.has_value())
    {
        m_out << "Syntax Error: unterminated quote\n";
        return;
    }
    if (tokens->empty())
    {
        return;
    }
    (void)execute(std::move(*tokens));
}

int CredentialShell::execute(std::vector<std::string> args)
{
    m_status = g_kExitOk;

    // 'help' prints the root help, not the help of the 'help' subcommand.
    if (!args.empty() && args.front() == "help")
    {
        args.front() = "--help";
    }

    CLI::App app{ "credhash: password credential hashing" };
    app.name("credhash");
    app.require_subcommand(1);

    app.add_subcommand("help", "Print this help message")->callback([]() { throw CLI::CallForHelp(); });
    app.add_subcommand("exit", "Exit the shell")->alias("quit")->callback([this]() { m_running = false; });

    std::string algorithmArg;
    std::string encodedArg;

    auto* subHash = app.add_subcommand("hash", "Hash a password (prompts for it)");
    subHash->add_option("algorithm", algorithmArg, "argon2id or bcrypt")->required();
    subHash->callback([&]() { doHash(algorithmArg); });

    auto* subVerify = app.add_subcommand("verify", "Check a password against an encoded hash");
    subVerify->add_option("encoded", encodedArg, "Encoded hash")->required();
    subVerify->callback([&]() { doVerify(encodedArg); });

    auto* subDecode = app.add_subcommand("decode", "Show the parameters stored in an encoded hash");
    subDecode->add_option("encoded", encodedArg, "Encoded hash")->required();
    subDecode->callback([&]() { doDecode(encodedArg); });

    auto* subRehash = app.add_subcommand("needs-rehash", "Compare an encoded hash with the current configuration");
    subRehash->add_option("encoded", encodedArg, "Encoded hash")->required();
    subRehash->add_option("algorithm", algorithmArg, "Target algorithm")->required();
    subRehash->callback([&]() { doNeedsRehash(encodedArg, algorithmArg); });

    app.add_subcommand("algorithms", "List supported algorithms")->callback([this]() { doAlgorithms(); });

    try
    {
        // CLI11 consumes the vector back to front.
        std::vector<std::string> reversed{ args.rbegin(), args.rend() };
        app.parse(reversed);
    }
    catch ([[maybe_unused]] const CLI::CallForHelp&)
    {
        m_out << app.help();
    }
    catch (const CLI::ParseError& e)
    {
        m_out << "Syntax Error: " << e.what() << "\n";
        m_status = g_kExitError;
    }
    catch (const credhash::core::PasswordHashError& e)
    {
        m_out << "Error: " << e.what();
        if (!e.field().empty())
        {
            m_out << " [" << e.field() << "]";
        }
        m_out << "\n";
        m_status = g_kExitError;
    }
    catch (const std::invalid_argument& e)
    {
        m_out << "Error: " << e.what() << "\n";
        m_status = g_kExitError;
    }
    return m_status;
}

void CredentialShell::doHash(const std::string& algorithm)
{
    auto p1 = m_pwdReader("Password: ");
    auto wipeP1 = credhash::security::scopeWipe(p1);

    auto p2 = m_pwdReader("Confirm Password: ");
    auto wipeP2 = credhash::security::scopeWipe(p2);

    if (credhash::security::asStringView(p1) != credhash::security::asStringView(p2))
    {
        m_out << "Error: Passwords do not match.\n";
        m_status = g_kExitError;
        return;
    }

    m_out << m_hasher.hash(algorithm, credhash::security::asStringView(p1)) << "\n";
}

void CredentialShell::doVerify(const std::string& encoded)
{
    auto pass = m_pwdReader("Password: ");
    auto wipePass = credhash::security::scopeWipe(pass);

    if (m_hasher.verify(credhash::security::asStringView(pass), encoded))
    {
        m_out << "match\n";
    }
    else
    {
        m_out << "no match\n";
        m_status = g_kExitNegative;
    }
}

void CredentialShell::doDecode(const std::string& encoded)
{
    printParameters(m_out, m_hasher.decode(encoded));
}

void CredentialShell::doNeedsRehash(const std::string& encoded, const std::string& algorithm)
{
    if (m_hasher.needsRehash(encoded, algorithm))
    {
        m_out << "yes\n";
    }
    else
    {
        m_out << "no\n";
        m_status = g_kExitNegative;
    }
}

void CredentialShell::doAlgorithms()
{
    for (const auto& name : m_hasher.algorithms())
    {
        m_out << " - " << name << "\n";
    }
}

} // namespace credhash::ui::cli
