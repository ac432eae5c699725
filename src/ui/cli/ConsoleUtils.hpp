#ifndef CREDHASH_UI_CLI_CONSOLEUTILS_HPP
#define CREDHASH_UI_CLI_CONSOLEUTILS_HPP

#include "credhash/security/SecureString.hpp"
#include <iosfwd>
#include <string_view>

namespace credhash::ui::cli
{

// Keeps typed passwords out of swap and core dumps. Best effort.
void lockProcessMemory() noexcept;

// Prompts on out and reads one line from in with terminal echo disabled when in is the
// console. The trailing newline is not part of the result.
[[nodiscard]] credhash::security::SecureString readPassword(std::string_view prompt, std::istream& in,
                                                            std::ostream& out);

} // namespace credhash::ui::cli

#endif // CREDHASH_UI_CLI_CONSOLEUTILS_HPP
