#ifndef CREDHASH_UI_CLI_TOKENIZER_HPP
#define CREDHASH_UI_CLI_TOKENIZER_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace credhash::ui::cli
{

// Splits a shell line on whitespace. '...' is taken literally; inside "..." only \" and \\
// are escapes; outside quotes a backslash escapes the next character. Encoded hashes need
// no quoting since '$' is not special here.
// std::nullopt for an unterminated quote.
[[nodiscard]] std::optional<std::vector<std::string>> tokenizeLine(std::string_view line);

} // namespace credhash::ui::cli

#endif // CREDHASH_UI_CLI_TOKENIZER_HPP
