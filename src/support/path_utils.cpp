//===----------------------------------------------------------------------===//
//
// Part of the Pathnorm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the ASCII-only string helpers the normalizer relies on.  Root
// markers are fixed ASCII folder names, so case folding is restricted to the
// basic Latin range and never consults the global locale.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Separator, whitespace and case-insensitive search helpers.

#include "support/path_utils.hpp"

#include <algorithm>
#include <filesystem>

namespace pathnorm::support
{
namespace
{
[[nodiscard]] constexpr char foldAscii(char ch) noexcept
{
    return (ch >= 'A' && ch <= 'Z') ? static_cast<char>(ch - 'A' + 'a') : ch;
}

[[nodiscard]] constexpr bool isSpace(char ch) noexcept
{
    return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\f' || ch == '\v';
}

[[nodiscard]] bool equalsIgnoreCase(std::string_view a, std::string_view b) noexcept
{
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return foldAscii(x) == foldAscii(y);
           });
}
} // namespace

char preferredSeparator() noexcept
{
    return static_cast<char>(std::filesystem::path::preferred_separator);
}

std::size_t findIgnoreCase(std::string_view haystack, std::string_view needle) noexcept
{
    if (needle.size() > haystack.size())
        return std::string_view::npos;
    for (std::size_t i = 0; i + needle.size() <= haystack.size(); ++i)
    {
        if (equalsIgnoreCase(haystack.substr(i, needle.size()), needle))
            return i;
    }
    return std::string_view::npos;
}

bool startsWithIgnoreCase(std::string_view text, std::string_view prefix) noexcept
{
    return text.size() >= prefix.size() && equalsIgnoreCase(text.substr(0, prefix.size()), prefix);
}

bool isBlank(std::string_view text) noexcept
{
    return std::all_of(text.begin(), text.end(), isSpace);
}

std::string_view trimWhitespace(std::string_view text) noexcept
{
    while (!text.empty() && isSpace(text.front()))
        text.remove_prefix(1);
    while (!text.empty() && isSpace(text.back()))
        text.remove_suffix(1);
    return text;
}

std::string_view trimLeadingForwardSlashes(std::string_view text) noexcept
{
    while (!text.empty() && text.front() == '/')
        text.remove_prefix(1);
    return text;
}

std::string_view trimLeadingSeparators(std::string_view text) noexcept
{
    while (!text.empty() && isSeparator(text.front()))
        text.remove_prefix(1);
    return text;
}

std::string_view trimTrailingSeparators(std::string_view text) noexcept
{
    while (!text.empty() && isSeparator(text.back()))
        text.remove_suffix(1);
    return text;
}

std::string replaceSeparators(std::string_view path, char separator)
{
    std::string out(path);
    std::replace_if(out.begin(), out.end(), isSeparator, separator);
    return out;
}

} // namespace pathnorm::support
