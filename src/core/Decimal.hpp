#ifndef CREDHASH_SRC_CORE_DECIMAL_HPP
#define CREDHASH_SRC_CORE_DECIMAL_HPP

#include <charconv>
#include <cstdint>
#include <optional>
#include <string_view>
#include <system_error>

namespace credhash::core::detail
{

// Canonical unsigned decimal: digits only, no sign, no whitespace, no leading zero
// except "0" itself. Anything else (including overflow) is std::nullopt.
[[nodiscard]] inline std::optional<std::uint64_t> parseCanonicalDecimal(std::string_view text) noexcept
{
    if (text.empty() || (text.size() > 1U && text.front() == '0'))
    {
        return std::nullopt;
    }

    std::uint64_t value{};
    const char* first{ text.data() };
    const char* last{ text.data() + text.size() };
    const auto [ptr, ec]{ std::from_chars(first, last, value) };
    if (ec != std::errc{} || ptr != last)
    {
        return std::nullopt;
    }
    return value;
}

} // namespace credhash::core::detail

#endif // CREDHASH_SRC_CORE_DECIMAL_HPP
