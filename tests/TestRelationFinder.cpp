#include <gtest/gtest.h>

#include "MediaClassifier.hpp"
#include "MetadataProbe.hpp"
#include "RelationFinder.hpp"
#include "TestHelpers.hpp"

using namespace TestSupport;

TEST(RelationFinder, StemRelations)
{
    EXPECT_TRUE(RelationFinder::StemsRelated("DJI_0001", "DJI_0001"));
    EXPECT_TRUE(RelationFinder::StemsRelated("DJI_0001", "DJI_0001_proxy"));
    EXPECT_TRUE(RelationFinder::StemsRelated("DJI_0001_edit", "DJI_0001"));
    EXPECT_TRUE(RelationFinder::StemsRelated("IMG 1", "IMG 1 copy"));
    EXPECT_FALSE(RelationFinder::StemsRelated("DJI_0001", "DJI_00010"));
    EXPECT_FALSE(RelationFinder::StemsRelated("DJI_0001", "DJI_0002"));
}

TEST(RelationFinder, CompanionsInSameDirectorySortedByName)
{
    TestEnvironment Env;
    const auto Dir = Env.Dir / "card";
    WriteFile(Dir / "DJI_0001.MP4", "video");
    WriteFile(Dir / "DJI_0001.SRT", "subtitles");
    WriteFile(Dir / "DJI_0001.LRF", "proxy");
    WriteFile(Dir / "DJI_0001_edit.xmp", "sidecar");
    WriteFile(Dir / "DJI_0001.op", "project");
    WriteFile(Dir / "DJI_0002.MP4", "other");
    WriteFile(Dir / "nested" / "DJI_0001.txt", "deeper");
    FS::create_directories(Dir / "DJI_0001");

    MetadataProbe Probe(Env.Context());
    MediaClassifier Classifier(Env.Context(), Probe);
    RelationFinder Finder(Env.Context(), Classifier);

    auto Related = Finder.RelatedFiles(Dir / "DJI_0001.MP4");
    ASSERT_EQ(Related.size(), 3u);
    EXPECT_EQ(Related[0].filename(), "DJI_0001.LRF");
    EXPECT_EQ(Related[1].filename(), "DJI_0001.SRT");
    EXPECT_EQ(Related[2].filename(), "DJI_0001_edit.xmp");
}

TEST(RelationFinder, DisabledBySetting)
{
    TestEnvironment Env;
    Env.Config.RelatedSameStem = false;
    WriteFile(Env.Dir / "a.jpg", "x");
    WriteFile(Env.Dir / "a.xmp", "x");

    MetadataProbe Probe(Env.Context());
    MediaClassifier Classifier(Env.Context(), Probe);
    RelationFinder Finder(Env.Context(), Classifier);

    EXPECT_TRUE(Finder.RelatedFiles(Env.Dir / "a.jpg").empty());
}
