//===----------------------------------------------------------------------===//
//
// Part of the Pathnorm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: core/FolderPath.hpp
// Purpose: Declare folder path options and the staged path normalizer.
// Key invariants: normalize() is idempotent for fixed options; null, empty and
//                 whitespace-only inputs are returned unchanged.
// Ownership/Lifetime: Options are value types; the normalizer copies them and
//                     holds no other state.
// Links: src/core/FolderPath.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pathnorm
{

/// @brief Well-known base directory a folder path is expressed relative to.
enum class FolderRoot
{
    FileSystem,      ///< Absolute path, kept as given ("C:/Game/Assets/A/").
    Assets,          ///< Relative to the project Assets folder ("Assets/A/").
    Resources,       ///< Relative to a Resources folder ("A/").
    StreamingAssets, ///< Relative to the StreamingAssets folder ("A/").
};

/// @brief Policy for a boundary (leading or trailing) separator.
enum class SlashRequirement
{
    Include,  ///< Separator forced present.
    Omit,     ///< Separators of either kind stripped.
    Optional, ///< Left as given.
};

/// @brief Separator character written into normalized output.
enum class SlashType
{
    System,   ///< Host file system's preferred separator.
    Forward,  ///< '/'
    Backward, ///< '\\'

    Windows = Forward,
    Unix = Backward,
};

/// @brief Configuration applied to every normalization.
/// @invariant Value type; defaults match a plain Assets folder field.
struct FolderPathOptions
{
    FolderRoot root = FolderRoot::Assets;
    SlashRequirement leading = SlashRequirement::Omit;
    SlashRequirement trailing = SlashRequirement::Include;
    SlashType slashes = SlashType::Forward;

    bool operator==(const FolderPathOptions &) const = default;
};

/// @brief Stages of a single normalization pass, in execution order.
enum class NormalizeStage
{
    UnifySeparators,
    ResolveRoot,
    ApplySlashStyle,
    LeadingSlash,
    TrailingSlash,
};

/// @brief Output of one stage during one pass.
struct StageRecord
{
    unsigned pass = 0; ///< 1-based pass number.
    NormalizeStage stage = NormalizeStage::UnifySeparators;
    std::string text; ///< Text after the stage ran.
};

/// @brief Caller-owned record of every stage executed by normalize().
struct NormalizationTrace
{
    std::vector<StageRecord> records;

    /// @brief Number of passes run; 0 when the input was returned unchanged.
    [[nodiscard]] unsigned passes() const
    {
        return records.empty() ? 0 : records.back().pass;
    }
};

/// @brief Run the five normalization stages exactly once.
/// @param path Non-blank path text; blank text is returned unchanged.
/// @param options Normalization configuration.
/// @param trace Optional sink receiving one record per stage.
/// @return Path after a single pass.
[[nodiscard]] std::string normalizeOnce(std::string_view path,
                                        const FolderPathOptions &options,
                                        NormalizationTrace *trace = nullptr);

/// @brief Normalize @p path, repeating passes until the text is stable.
/// @details Most inputs are stable after one pass; repeating guarantees
///          normalize(normalize(p)) == normalize(p) for every input.
///          Under the Assets root "/Assets" yields "Assets/", where
///          normalizeOnce() yields "Assets/Assets/".
/// @return Normalized path; blank input is returned unchanged.
[[nodiscard]] std::string normalize(std::string_view path,
                                    const FolderPathOptions &options,
                                    NormalizationTrace *trace = nullptr);

/// @brief Nullable variant of normalize(); an absent path stays absent.
[[nodiscard]] std::optional<std::string> normalizeOptional(
    const std::optional<std::string> &path,
    const FolderPathOptions &options,
    NormalizationTrace *trace = nullptr);

/// @brief Convenience wrapper binding a fixed set of options.
class PathNormalizer
{
  public:
    PathNormalizer() = default;

    explicit PathNormalizer(FolderPathOptions options) : options_(options) {}

    [[nodiscard]] const FolderPathOptions &options() const
    {
        return options_;
    }

    [[nodiscard]] std::string normalize(std::string_view path,
                                        NormalizationTrace *trace = nullptr) const;

    [[nodiscard]] std::optional<std::string> normalizeOptional(
        const std::optional<std::string> &path, NormalizationTrace *trace = nullptr) const;

    /// @brief Whether @p path is already in normalized form.
    [[nodiscard]] bool isNormalized(std::string_view path) const;

  private:
    FolderPathOptions options_{};
};

} // namespace pathnorm
