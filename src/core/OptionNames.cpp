//===----------------------------------------------------------------------===//
//
// Part of the Pathnorm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Maps folder path option enums to the lowercase names used by the manifest,
// the environment and the command line, and back.
//
//===----------------------------------------------------------------------===//

#include "core/OptionNames.hpp"

#include <cctype>

namespace pathnorm
{
namespace
{

/// @brief Lowercase @p text, drop surrounding whitespace and '-'/'_' separators.
std::string canonicalKey(std::string_view text)
{
    std::string key;
    key.reserve(text.size());
    for (unsigned char ch : text)
    {
        if (std::isspace(ch) || ch == '-' || ch == '_')
            continue;
        key.push_back(static_cast<char>(std::tolower(ch)));
    }
    return key;
}

} // namespace

std::string_view toString(FolderRoot root) noexcept
{
    switch (root)
    {
        case FolderRoot::FileSystem:
            return "filesystem";
        case FolderRoot::Assets:
            return "assets";
        case FolderRoot::Resources:
            return "resources";
        case FolderRoot::StreamingAssets:
            return "streamingassets";
    }
    return "unknown";
}

std::string_view toString(SlashRequirement requirement) noexcept
{
    switch (requirement)
    {
        case SlashRequirement::Include:
            return "include";
        case SlashRequirement::Omit:
            return "omit";
        case SlashRequirement::Optional:
            return "optional";
    }
    return "unknown";
}

std::string_view toString(SlashType slashes) noexcept
{
    switch (slashes)
    {
        case SlashType::System:
            return "system";
        case SlashType::Forward:
            return "forward";
        case SlashType::Backward:
            return "backward";
    }
    return "unknown";
}

std::string_view toString(NormalizeStage stage) noexcept
{
    switch (stage)
    {
        case NormalizeStage::UnifySeparators:
            return "unify-separators";
        case NormalizeStage::ResolveRoot:
            return "resolve-root";
        case NormalizeStage::ApplySlashStyle:
            return "apply-slash-style";
        case NormalizeStage::LeadingSlash:
            return "leading-slash";
        case NormalizeStage::TrailingSlash:
            return "trailing-slash";
    }
    return "unknown";
}

std::optional<FolderRoot> parseFolderRoot(std::string_view name)
{
    const std::string key = canonicalKey(name);
    for (FolderRoot root : kAllFolderRoots)
    {
        if (key == toString(root))
            return root;
    }
    return std::nullopt;
}

std::optional<SlashRequirement> parseSlashRequirement(std::string_view name)
{
    const std::string key = canonicalKey(name);
    for (SlashRequirement requirement : kAllSlashRequirements)
    {
        if (key == toString(requirement))
            return requirement;
    }
    return std::nullopt;
}

std::optional<SlashType> parseSlashType(std::string_view name)
{
    const std::string key = canonicalKey(name);
    if (key == "native")
        return SlashType::System;
    if (key == "windows")
        return SlashType::Windows;
    if (key == "unix")
        return SlashType::Unix;
    for (SlashType slashes : kAllSlashTypes)
    {
        if (key == toString(slashes))
            return slashes;
    }
    return std::nullopt;
}

std::string describe(const FolderPathOptions &options)
{
    std::string out = "root=";
    out += toString(options.root);
    out += " slashes=";
    out += toString(options.slashes);
    out += " leading=";
    out += toString(options.leading);
    out += " trailing=";
    out += toString(options.trailing);
    return out;
}

} // namespace pathnorm
