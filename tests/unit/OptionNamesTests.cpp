// File: tests/unit/OptionNamesTests.cpp
// Purpose: Verify option enum names round-trip and accept documented aliases.
// Key invariants: Every enumerator has a distinct canonical name.
// Ownership/Lifetime: Standalone unit test executable.
// Links: src/core/OptionNames.cpp

#include <gtest/gtest.h>

#include "core/OptionNames.hpp"

#include <set>
#include <string>

using namespace pathnorm;

TEST(OptionNames, RootsRoundTrip)
{
    std::set<std::string> seen;
    for (FolderRoot root : kAllFolderRoots)
    {
        const auto name = toString(root);
        EXPECT_NE(name, "unknown");
        EXPECT_TRUE(seen.insert(std::string(name)).second);
        ASSERT_TRUE(parseFolderRoot(name).has_value());
        EXPECT_EQ(*parseFolderRoot(name), root);
    }
}

TEST(OptionNames, RequirementsAndSlashTypesRoundTrip)
{
    for (SlashRequirement requirement : kAllSlashRequirements)
        EXPECT_EQ(parseSlashRequirement(toString(requirement)), requirement);
    for (SlashType slashes : kAllSlashTypes)
        EXPECT_EQ(parseSlashType(toString(slashes)), slashes);
}

TEST(OptionNames, StagesHaveDistinctNames)
{
    std::set<std::string> seen;
    for (NormalizeStage stage : kAllNormalizeStages)
    {
        EXPECT_NE(toString(stage), "unknown");
        EXPECT_TRUE(seen.insert(std::string(toString(stage))).second);
    }
}

TEST(OptionNames, ParsingIgnoresCaseAndSeparators)
{
    EXPECT_EQ(parseFolderRoot("StreamingAssets"), FolderRoot::StreamingAssets);
    EXPECT_EQ(parseFolderRoot("streaming_assets"), FolderRoot::StreamingAssets);
    EXPECT_EQ(parseFolderRoot("  File-System "), FolderRoot::FileSystem);
    EXPECT_EQ(parseFolderRoot("ASSETS"), FolderRoot::Assets);
    EXPECT_EQ(parseSlashRequirement("Optional"), SlashRequirement::Optional);
}

TEST(OptionNames, SlashTypeAliases)
{
    EXPECT_EQ(parseSlashType("windows"), SlashType::Forward);
    EXPECT_EQ(parseSlashType("Unix"), SlashType::Backward);
    EXPECT_EQ(parseSlashType("native"), SlashType::System);
    EXPECT_EQ(toString(SlashType::Windows), "forward");
    EXPECT_EQ(toString(SlashType::Unix), "backward");
}

TEST(OptionNames, UnknownNamesAreRejected)
{
    EXPECT_FALSE(parseFolderRoot("library").has_value());
    EXPECT_FALSE(parseFolderRoot("").has_value());
    EXPECT_FALSE(parseSlashRequirement("always").has_value());
    EXPECT_FALSE(parseSlashType("diagonal").has_value());
}

TEST(OptionNames, DescribeListsEveryField)
{
    EXPECT_EQ(describe(FolderPathOptions{}), "root=assets slashes=forward leading=omit trailing=include");

    FolderPathOptions options;
    options.root = FolderRoot::StreamingAssets;
    options.slashes = SlashType::Backward;
    options.leading = SlashRequirement::Include;
    options.trailing = SlashRequirement::Optional;
    EXPECT_EQ(describe(options), "root=streamingassets slashes=backward leading=include trailing=optional");
}

TEST(OptionNames, InteriorWhitespaceIsIgnored)
{
    EXPECT_EQ(parseFolderRoot("streaming assets"), FolderRoot::StreamingAssets);
    EXPECT_EQ(parseFolderRoot("File System"), FolderRoot::FileSystem);
    EXPECT_EQ(parseSlashType(" back ward "), SlashType::Backward);
}
