//===----------------------------------------------------------------------===//
//
// Part of the Pathnorm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements folder path normalization.  A pass runs five stages in order:
// separator unification, root resolution, slash style, leading slash and
// trailing slash.  Each stage only consults the options relevant to it, so the
// root kind decides which of the later stages are active.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Staged folder path normalizer.
/// @details Root markers are searched case-insensitively.  Under the Assets
///          root the marker's folder name is kept ("Assets/..."), whereas the
///          Resources and StreamingAssets roots drop both the marker and the
///          folder name.  Callers rely on that asymmetry, so it is preserved.

#include "core/FolderPath.hpp"

#include "support/path_utils.hpp"

#include <cstddef>
#include <utility>

namespace pathnorm
{
namespace
{
using support::findIgnoreCase;
using support::startsWithIgnoreCase;

constexpr std::string_view kAssetsMarker = "/Assets/";
constexpr std::string_view kAssetsPrefix = "Assets/";
constexpr std::string_view kResourcesFolder = "Resources";
constexpr std::string_view kStreamingAssetsFolder = "StreamingAssets";

/// @brief Separator written for @p slashes.
[[nodiscard]] char separatorFor(SlashType slashes)
{
    switch (slashes)
    {
        case SlashType::System:
            return support::preferredSeparator();
        case SlashType::Forward:
            return '/';
        case SlashType::Backward:
            return '\\';
    }
    return '/';
}

/// @brief Roots whose paths are engine-internal and always use '/'.
[[nodiscard]] bool forcesForwardSlashes(FolderRoot root)
{
    switch (root)
    {
        case FolderRoot::FileSystem:
        case FolderRoot::Assets:
            return false;
        case FolderRoot::Resources:
        case FolderRoot::StreamingAssets:
            return true;
    }
    return false;
}

/// @brief Strip everything up to "/Assets/" or make the path Assets-relative.
[[nodiscard]] std::string resolveAssets(std::string_view input)
{
    const std::size_t idx = findIgnoreCase(input, kAssetsMarker);
    if (idx != std::string_view::npos)
        return std::string(input.substr(idx + 1)); // keep "Assets/"
    if (startsWithIgnoreCase(input, kAssetsPrefix))
        return std::string(input);
    std::string out(kAssetsPrefix);
    out += support::trimLeadingForwardSlashes(input);
    return out;
}

/// @brief Strip everything up to and including "/<folder>/" or a "<folder>/" prefix.
[[nodiscard]] std::string resolveSubfolder(std::string_view input, std::string_view folder)
{
    std::string prefix(folder);
    prefix += '/';
    const std::string marker = '/' + prefix;

    const std::size_t idx = findIgnoreCase(input, marker);
    if (idx != std::string_view::npos)
        return std::string(input.substr(idx + marker.size()));
    if (startsWithIgnoreCase(input, prefix))
        return std::string(input.substr(prefix.size()));
    return std::string(input);
}

[[nodiscard]] std::string resolveRoot(std::string_view input, FolderRoot root)
{
    switch (root)
    {
        case FolderRoot::FileSystem:
            return std::string(input);
        case FolderRoot::Assets:
            return resolveAssets(input);
        case FolderRoot::Resources:
            return resolveSubfolder(input, kResourcesFolder);
        case FolderRoot::StreamingAssets:
            return resolveSubfolder(input, kStreamingAssetsFolder);
    }
    return std::string(input);
}

[[nodiscard]] std::string applySlashStyle(std::string text, const FolderPathOptions &options)
{
    if (forcesForwardSlashes(options.root))
        return support::replaceSeparators(text, '/');
    return support::replaceSeparators(text, separatorFor(options.slashes));
}

[[nodiscard]] std::string applyLeading(std::string text, SlashRequirement policy, char sep)
{
    switch (policy)
    {
        case SlashRequirement::Include:
            if (text.empty() || text.front() != sep)
                text.insert(text.begin(), sep);
            return text;
        case SlashRequirement::Omit:
            return std::string(support::trimLeadingSeparators(text));
        case SlashRequirement::Optional:
            return text;
    }
    return text;
}

[[nodiscard]] std::string applyTrailing(std::string text, SlashRequirement policy, char sep)
{
    switch (policy)
    {
        case SlashRequirement::Include:
            if (text.empty() || text.back() != sep)
                text.push_back(sep);
            return text;
        case SlashRequirement::Omit:
            return std::string(support::trimTrailingSeparators(text));
        case SlashRequirement::Optional:
            return text;
    }
    return text;
}

void record(NormalizationTrace *trace, unsigned pass, NormalizeStage stage, const std::string &text)
{
    if (trace)
        trace->records.push_back(StageRecord{pass, stage, text});
}

/// @brief Execute the five stages once on non-blank @p path.
[[nodiscard]] std::string runPass(std::string_view path,
                                  const FolderPathOptions &options,
                                  unsigned pass,
                                  NormalizationTrace *trace)
{
    // 1) parse on forward slashes only
    std::string text = support::replaceSeparators(path, '/');
    text = std::string(support::trimWhitespace(text));
    record(trace, pass, NormalizeStage::UnifySeparators, text);

    // 2) strip the absolute prefix or make the path root-relative
    text = resolveRoot(text, options.root);
    record(trace, pass, NormalizeStage::ResolveRoot, text);

    // 3) output separator
    text = applySlashStyle(std::move(text), options);
    record(trace, pass, NormalizeStage::ApplySlashStyle, text);

    const char sep = separatorFor(options.slashes);

    // 4) leading separator only matters for Assets-relative paths
    if (options.root == FolderRoot::Assets)
        text = applyLeading(std::move(text), options.leading, sep);
    record(trace, pass, NormalizeStage::LeadingSlash, text);

    // 5) trailing separator marks folders for FileSystem and Assets paths
    if (options.root == FolderRoot::FileSystem || options.root == FolderRoot::Assets)
        text = applyTrailing(std::move(text), options.trailing, sep);
    record(trace, pass, NormalizeStage::TrailingSlash, text);

    return text;
}
} // namespace

std::string normalizeOnce(std::string_view path, const FolderPathOptions &options, NormalizationTrace *trace)
{
    if (support::isBlank(path))
        return std::string(path);
    return runPass(path, options, 1, trace);
}

std::string normalize(std::string_view path, const FolderPathOptions &options, NormalizationTrace *trace)
{
    if (support::isBlank(path))
        return std::string(path);

    std::string current = runPass(path, options, 1, trace);

    // Every pass that changes the text either shortens it or, on the second
    // pass at most, re-adds a boundary separator, so input length bounds the loop.
    const std::size_t maxPasses = path.size() + 2;
    for (unsigned pass = 2; pass <= maxPasses; ++pass)
    {
        if (support::isBlank(current))
            break;
        const std::size_t mark = trace ? trace->records.size() : 0;
        std::string next = runPass(current, options, pass, trace);
        if (next == current)
        {
            if (trace)
                trace->records.resize(mark);
            break;
        }
        current = std::move(next);
    }
    return current;
}

std::optional<std::string> normalizeOptional(const std::optional<std::string> &path,
                                             const FolderPathOptions &options,
                                             NormalizationTrace *trace)
{
    if (!path)
        return std::nullopt;
    return normalize(*path, options, trace);
}

std::string PathNormalizer::normalize(std::string_view path, NormalizationTrace *trace) const
{
    return pathnorm::normalize(path, options_, trace);
}

std::optional<std::string> PathNormalizer::normalizeOptional(const std::optional<std::string> &path,
                                                             NormalizationTrace *trace) const
{
    return pathnorm::normalizeOptional(path, options_, trace);
}

bool PathNormalizer::isNormalized(std::string_view path) const
{
    return normalize(path) == path;
}

} // namespace pathnorm
