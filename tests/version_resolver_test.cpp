#include <gtest/gtest.h>
#include "core/version_resolver.hpp"

class VersionResolverTest : public ::testing::Test
{
protected:
    VersionDetectionSettings settings;

    VersionResolver resolver() const { return VersionResolver(settings); }
};

TEST_F(VersionResolverTest, EmptyDestinationKeepsName)
{
    auto decision = resolver().resolve("Movie.Title.2020.mkv", {});
    EXPECT_FALSE(decision.is_duplicate);
    EXPECT_EQ(decision.version_number, 1);
    EXPECT_EQ(decision.output_filename, "Movie.Title.2020.mkv");
    EXPECT_TRUE(decision.matched_files.empty());
}

TEST_F(VersionResolverTest, SimilarTitleBecomesSecondVersion)
{
    auto decision = resolver().resolve("Movie Title 2020.mkv", {"Movie.Title.2020.mkv"});
    EXPECT_TRUE(decision.is_duplicate);
    EXPECT_EQ(decision.version_number, 2);
    EXPECT_NE(decision.output_filename.find(".v2"), std::string::npos);
    EXPECT_EQ(decision.output_filename, "Movie Title 2020.v2.mkv");
    ASSERT_EQ(decision.matched_files.size(), 1u);
    EXPECT_EQ(decision.matched_files[0], "Movie.Title.2020.mkv");
}

TEST_F(VersionResolverTest, NextVersionIsHighestPlusOne)
{
    auto decision = resolver().resolve("Heat (1995).mkv",
                                       {"Heat (1995).mkv", "Heat (1995).v3.mkv", "Heat (1995).v2.mkv", "Other (2001).mkv"});
    EXPECT_TRUE(decision.is_duplicate);
    EXPECT_EQ(decision.version_number, 4);
    EXPECT_EQ(decision.output_filename, "Heat (1995).v4.mkv");
    EXPECT_EQ(decision.matched_files.size(), 3u);
}

TEST_F(VersionResolverTest, UnrelatedTitlesAreNotDuplicates)
{
    auto decision = resolver().resolve("Alien (1979).mkv", {"Heat (1995).mkv", "Ronin (1998).mp4"});
    EXPECT_FALSE(decision.is_duplicate);
    EXPECT_EQ(decision.output_filename, "Alien (1979).mkv");
}

TEST_F(VersionResolverTest, ExactMatchOnlyWhenSimilarityDisabled)
{
    settings.check_similar = false;
    auto similar = resolver().resolve("Movie Title 2020.mkv", {"Movie.Title.2020.mkv"});
    EXPECT_FALSE(similar.is_duplicate);

    auto exact = resolver().resolve("movie title 2020.mkv", {"Movie Title 2020.mp4"});
    EXPECT_TRUE(exact.is_duplicate);
    EXPECT_EQ(exact.output_filename, "movie title 2020.v2.mkv");
}

TEST_F(VersionResolverTest, DisabledDetectionPassesThrough)
{
    settings.enabled = false;
    auto decision = resolver().resolve("Heat (1995).mkv", {"Heat (1995).mkv"});
    EXPECT_FALSE(decision.is_duplicate);
    EXPECT_EQ(decision.version_number, 1);
    EXPECT_EQ(decision.output_filename, "Heat (1995).mkv");
}

TEST_F(VersionResolverTest, CustomFormat)
{
    settings.format = " - Version {number}";
    auto r = resolver();
    EXPECT_EQ(r.formatSuffix(2), " - Version 2");
    EXPECT_EQ(r.extractVersion("Heat (1995) - Version 5.mkv").value_or(0), 5);
    EXPECT_EQ(r.normalizedTitle("Heat (1995) - version 5.mkv"), "Heat (1995)");

    auto decision = r.resolve("Heat (1995).mkv", {"Heat (1995) - Version 2.mkv"});
    EXPECT_EQ(decision.output_filename, "Heat (1995) - Version 3.mkv");
}

TEST_F(VersionResolverTest, FormatWithoutPlaceholderFallsBack)
{
    settings.format = "-copy";
    EXPECT_EQ(resolver().formatSuffix(2), ".v2");
}

TEST_F(VersionResolverTest, ExtensionSplitting)
{
    auto r = resolver();
    std::string ext;
    EXPECT_EQ(r.splitExtension("Movie.Title.2020.mkv", ext), "Movie.Title.2020");
    EXPECT_EQ(ext, ".mkv");
    EXPECT_EQ(r.splitExtension("Movie.Title.2020", ext), "Movie.Title.2020");
    EXPECT_EQ(ext, "");
    EXPECT_EQ(r.splitExtension("Movie.Title.v2", ext), "Movie.Title.v2");
    EXPECT_EQ(ext, "");
    EXPECT_EQ(r.splitExtension(".hidden", ext), ".hidden");
    EXPECT_EQ(ext, "");
}

TEST_F(VersionResolverTest, UnversionedExistingFileCountsAsVersionOne)
{
    auto r = resolver();
    EXPECT_FALSE(r.extractVersion("Heat (1995).mkv").has_value());
    EXPECT_EQ(r.extractVersion("Heat (1995).V7.mkv").value_or(0), 7);
}
