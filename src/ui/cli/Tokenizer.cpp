#include "Tokenizer.hpp"

#include <cctype>
#include <cstddef>
#include <cstdint>
#include <utility>

namespace credhash::ui::cli
{
namespace
{

enum class Quote : std::uint8_t
{
    None,
    Single,
    Double
};

[[nodiscard]] bool isBlank(char c) noexcept
{
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

} // namespace

std::optional<std::vector<std::string>> tokenizeLine(std::string_view line)
{
    std::vector<std::string> tokens{};
    std::string current{};
    bool inToken{ false };
    Quote quote{ Quote::None };

    for (std::size_t i{}; i < line.size(); ++i)
    {
        const char c{ line[i] };
        const bool hasNext{ i + 1U < line.size() };

        if (quote == Quote::Single)
        {
            if (c == '\'')
            {
                quote = Quote::None;
            }
            else
            {
                current.push_back(c);
            }
            continue;
        }

        if (quote == Quote::Double)
        {
            if (c == '"')
            {
                quote = Quote::None;
            }
            else if (c == '\\' && hasNext && (line[i + 1U] == '"' || line[i + 1U] == '\\'))
            {
                current.push_back(line[++i]);
            }
            else
            {
                current.push_back(c);
            }
            continue;
        }

        if (isBlank(c))
        {
            if (inToken)
            {
                tokens.push_back(std::move(current));
                current.clear();
                inToken = false;
            }
            continue;
        }

        inToken = true;
        if (c == '\'')
        {
            quote = Quote::Single;
        }
        else if (c == '"')
        {
            quote = Quote::Double;
        }
        else if (c == '\\' && hasNext)
        {
            current.push_back(line[++i]);
        }
        else
        {
            current.push_back(c);
        }
    }

    if (quote != Quote::None)
    {
        return std::nullopt;
    }
    if (inToken)
    {
        tokens.push_back(std::move(current));
    }
    return tokens;
}

} // namespace credhash::ui::cli
