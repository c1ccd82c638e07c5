#include <gtest/gtest.h>

#include "DevicePatternDatabase.hpp"
#include "TestHelpers.hpp"

using namespace TestSupport;

namespace
{
    const char* PatternDocument = R"({
  "device_patterns": {
    "GoPro": { "extensions": [".MP4"], "filename_prefixes": ["gx"] },
    "Generic G": { "filename_prefixes": ["G"] },
    "Insta360": { "extensions": [".insv"], "filename_contains": ["_00_"] }
  }
})";
}

TEST(DevicePatternDatabase, FirstMatchInDocumentOrder)
{
    TempDir Dir;
    Logger Log;
    WriteFile(Dir / "patterns.json", PatternDocument);
    DevicePatternDatabase Db(Dir / "patterns.json", Log);

    EXPECT_EQ(Db.Size(), 3u);
    EXPECT_EQ(Db.Match("GX010001.MP4"), std::optional<std::string>("GoPro"));
    EXPECT_EQ(Db.Match("gx010001.mp4"), std::optional<std::string>("GoPro"));
    EXPECT_EQ(Db.Match("GX010001.JPG"), std::optional<std::string>("Generic G"));
    EXPECT_EQ(Db.Match("VID_20240301_00_001.insv"), std::optional<std::string>("Insta360"));
    EXPECT_FALSE(Db.Match("VID_20240301_00_001.mp4").has_value());
}

TEST(DevicePatternDatabase, MissingFileIsEmpty)
{
    TempDir Dir;
    Logger Log;
    DevicePatternDatabase Db(Dir / "missing.json", Log);

    EXPECT_EQ(Db.Size(), 0u);
    EXPECT_FALSE(Db.Match("GX010001.MP4").has_value());
}

TEST(DevicePatternDatabase, MalformedFileIsEmpty)
{
    TempDir Dir;
    Logger Log;
    WriteFile(Dir / "patterns.json", "{ \"device_patterns\": [");
    DevicePatternDatabase Db(Dir / "patterns.json", Log);

    EXPECT_EQ(Db.Size(), 0u);
}

TEST(DevicePatternDatabase, WrongShapeRejected)
{
    Logger Log;
    DevicePatternDatabase Db("", Log);

    EXPECT_FALSE(Db.LoadDocument(nlohmann::ordered_json::array()));
    EXPECT_FALSE(Db.LoadDocument(nlohmann::ordered_json::parse(R"({ "device_patterns": [1, 2] })")));
    EXPECT_TRUE(Db.LoadDocument(nlohmann::ordered_json::parse(PatternDocument)));
    EXPECT_EQ(Db.Size(), 3u);
}
