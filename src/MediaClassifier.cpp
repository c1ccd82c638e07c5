#include "MediaClassifier.hpp"
#include "StringUtils.hpp"

namespace FS = std::filesystem;

namespace
{
    std::set<std::string> LowerSet(const std::vector<std::string>& Values)
    {
        std::set<std::string> Result;
        for (const auto& Value : Values)
        {
            Result.insert(ToLowerAscii(Value));
        }
        return Result;
    }

    std::string ExtensionOf(const FS::path& FilePath)
    {
        return ToLowerAscii(PathToUtf8(FilePath.extension()));
    }
}

MediaClassifier::MediaClassifier(const RunContext& Context, MetadataProbe& Probe)
    : Config(Context.Config), Probe(Probe)
{
    ImageExtensions = LowerSet(Config.ImageExtensions);
    AudioExtensions = LowerSet(Config.AudioExtensions);
    LeaveInPlaceExtensions = LowerSet(Config.LeaveInPlaceExtensions);
    PanoramicExtensionSet = LowerSet(PanoramicExtensions());

    // Panoramic and drone proxy formats are recognised whatever the configured list says.
    VideoExtensions = LowerSet(Config.VideoExtensions);
    for (const auto& Extension : DefaultVideoExtensions())
    {
        VideoExtensions.insert(Extension);
    }
}

bool MediaClassifier::ShouldLeaveInPlace(const FS::path& FilePath) const
{
    if (LeaveInPlaceExtensions.count(ExtensionOf(FilePath)) != 0)
    {
        return true;
    }
    const std::string Name = ToLowerAscii(PathToUtf8(FilePath.filename()));
    return EndsWith(Name, ".fg.op") || EndsWith(Name, ".fg.ed");
}

bool MediaClassifier::IsPanoramicByPath(const FS::path& FilePath) const
{
    const std::string Extension = ExtensionOf(FilePath);
    if (PanoramicExtensionSet.count(Extension) != 0)
    {
        return true;
    }
    if (VideoExtensions.count(Extension) == 0)
    {
        return false;
    }
    const std::string Stem = ToLowerAscii(PathToUtf8(FilePath.stem()));
    return Contains(Stem, "360") || Contains(Stem, "panoram") || Contains(Stem, "theta") || Contains(Stem, "insta360");
}

std::optional<MediaKind> MediaClassifier::Classify(const FS::path& FilePath)
{
    const std::string Extension = ExtensionOf(FilePath);
    if (Extension.empty())
    {
        return std::nullopt;
    }
    if (ImageExtensions.count(Extension) != 0)
    {
        return MediaKind::Image;
    }
    if (AudioExtensions.count(Extension) != 0)
    {
        return MediaKind::Audio;
    }
    if (VideoExtensions.count(Extension) == 0)
    {
        return std::nullopt;
    }
    if (IsPanoramicByPath(FilePath))
    {
        return MediaKind::PanoramicVideo;
    }
    if (Config.UseExifTool && Probe.IsPanoramicByMetadata(FilePath))
    {
        return MediaKind::PanoramicVideo;
    }
    return MediaKind::Video;
}
