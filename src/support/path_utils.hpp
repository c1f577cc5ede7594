//===----------------------------------------------------------------------===//
//
// Part of the Pathnorm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/path_utils.hpp
// Purpose: Declare ASCII string helpers used to rewrite folder path text.
// Key invariants: Helpers never allocate beyond the returned string and treat
//                 only '/' and '\\' as separators. Case folding is ASCII only.
// Ownership/Lifetime: Returned strings are owned by the caller; views borrow
//                     from the arguments.
// Links: src/support/path_utils.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace pathnorm::support
{

/// @brief Determine whether @p ch is a path separator ('/' or '\\').
[[nodiscard]] constexpr bool isSeparator(char ch) noexcept
{
    return ch == '/' || ch == '\\';
}

/// @brief Separator preferred by the host file system.
/// @return '\\' on Windows hosts, '/' elsewhere.
[[nodiscard]] char preferredSeparator() noexcept;

/// @brief Locate @p needle in @p haystack ignoring ASCII case.
/// @return Offset of the first match or std::string_view::npos.
[[nodiscard]] std::size_t findIgnoreCase(std::string_view haystack, std::string_view needle) noexcept;

/// @brief Test whether @p text begins with @p prefix ignoring ASCII case.
[[nodiscard]] bool startsWithIgnoreCase(std::string_view text, std::string_view prefix) noexcept;

/// @brief Determine whether @p text is empty or made only of whitespace.
[[nodiscard]] bool isBlank(std::string_view text) noexcept;

/// @brief Remove leading and trailing whitespace.
[[nodiscard]] std::string_view trimWhitespace(std::string_view text) noexcept;

/// @brief Remove every leading '/' (only forward slashes).
[[nodiscard]] std::string_view trimLeadingForwardSlashes(std::string_view text) noexcept;

/// @brief Remove every leading separator of either kind.
[[nodiscard]] std::string_view trimLeadingSeparators(std::string_view text) noexcept;

/// @brief Remove every trailing separator of either kind.
[[nodiscard]] std::string_view trimTrailingSeparators(std::string_view text) noexcept;

/// @brief Rewrite every separator of either kind to @p separator.
/// @param path Text to rewrite.
/// @param separator Replacement separator character.
/// @return Copy of @p path using only @p separator.
[[nodiscard]] std::string replaceSeparators(std::string_view path, char separator);

} // namespace pathnorm::support
