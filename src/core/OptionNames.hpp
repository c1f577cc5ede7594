//===----------------------------------------------------------------------===//
//
// Part of the Pathnorm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: core/OptionNames.hpp
// Purpose: Stable text names for folder path option enums.
// Key invariants: toString() and the parse functions round-trip for every
//                 enumerator; parsing is ASCII case-insensitive.
// Ownership/Lifetime: Returned views reference static storage.
// Links: src/core/OptionNames.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "core/FolderPath.hpp"

#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace pathnorm
{

inline constexpr std::array<FolderRoot, 4> kAllFolderRoots{
    FolderRoot::FileSystem,
    FolderRoot::Assets,
    FolderRoot::Resources,
    FolderRoot::StreamingAssets,
};

inline constexpr std::array<SlashRequirement, 3> kAllSlashRequirements{
    SlashRequirement::Include,
    SlashRequirement::Omit,
    SlashRequirement::Optional,
};

inline constexpr std::array<SlashType, 3> kAllSlashTypes{
    SlashType::System,
    SlashType::Forward,
    SlashType::Backward,
};

inline constexpr std::array<NormalizeStage, 5> kAllNormalizeStages{
    NormalizeStage::UnifySeparators,
    NormalizeStage::ResolveRoot,
    NormalizeStage::ApplySlashStyle,
    NormalizeStage::LeadingSlash,
    NormalizeStage::TrailingSlash,
};

[[nodiscard]] std::string_view toString(FolderRoot root) noexcept;
[[nodiscard]] std::string_view toString(SlashRequirement requirement) noexcept;
[[nodiscard]] std::string_view toString(SlashType slashes) noexcept;
[[nodiscard]] std::string_view toString(NormalizeStage stage) noexcept;

/// @brief Parse a root name such as "assets" or "streaming-assets".
/// @return Parsed root or empty optional when @p name is not recognised.
[[nodiscard]] std::optional<FolderRoot> parseFolderRoot(std::string_view name);

/// @brief Parse "include", "omit" or "optional".
[[nodiscard]] std::optional<SlashRequirement> parseSlashRequirement(std::string_view name);

/// @brief Parse a slash style; accepts "windows", "unix" and "native" aliases.
[[nodiscard]] std::optional<SlashType> parseSlashType(std::string_view name);

/// @brief Render @p options as "root=... slashes=... leading=... trailing=...".
[[nodiscard]] std::string describe(const FolderPathOptions &options);

} // namespace pathnorm
