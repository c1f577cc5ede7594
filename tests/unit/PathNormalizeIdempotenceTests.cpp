// File: tests/unit/PathNormalizeIdempotenceTests.cpp
// Purpose: Check that normalizing an already normalized path is a no-op for
//          every combination of options.
// Key invariants: normalize(normalize(p)) == normalize(p).
// Ownership/Lifetime: Standalone unit test executable.
// Links: src/core/FolderPath.cpp

#include <gtest/gtest.h>

#include "core/FolderPath.hpp"
#include "core/OptionNames.hpp"

#include <string>
#include <vector>

using namespace pathnorm;

namespace
{
const std::vector<std::string> &corpus()
{
    static const std::vector<std::string> paths = {
        "C:/MyGame/Assets/MyFolder/MySubFolder/",
        "C:\\MyGame\\Assets\\Resources\\MyFolder\\MySubFolder\\",
        "C:/MyGame/Assets/StreamingAssets/MyFolder/MySubFolder/",
        "/home/dev/game/assets/art",
        "Assets",
        "/Assets",
        "assets",
        "Assets/Assets/Assets/",
        "a/Resources/Resources/b",
        "Resources/StreamingAssets/Resources/x",
        "C:/Resources/ x/",
        "C:/StreamingAssets/  ",
        "  \\\\server\\share\\Assets\\Tex  ",
        "///",
        "\\",
        "Resources/",
        "x/Assets/ /y",
        "MyFolder",
    };
    return paths;
}

std::vector<FolderPathOptions> allOptions()
{
    std::vector<FolderPathOptions> out;
    for (FolderRoot root : kAllFolderRoots)
        for (SlashType slashes : kAllSlashTypes)
            for (SlashRequirement leading : kAllSlashRequirements)
                for (SlashRequirement trailing : kAllSlashRequirements)
                    out.push_back(FolderPathOptions{root, leading, trailing, slashes});
    return out;
}
} // namespace

TEST(PathNormalizeIdempotence, SecondNormalizationIsNoOp)
{
    for (const auto &options : allOptions())
    {
        for (const auto &path : corpus())
        {
            const std::string once = normalize(path, options);
            EXPECT_EQ(normalize(once, options), once) << describe(options) << " input=\"" << path << '"';
        }
    }
}

TEST(PathNormalizeIdempotence, NormalizedOutputReportsStable)
{
    for (const auto &options : allOptions())
    {
        const PathNormalizer normalizer(options);
        for (const auto &path : corpus())
            EXPECT_TRUE(normalizer.isNormalized(normalizer.normalize(path))) << describe(options);
    }
}
